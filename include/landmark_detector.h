#ifndef LANDMARK_DETECTOR_H
#define LANDMARK_DETECTOR_H

#include <vector>
#include <opencv2/core.hpp>
#include "face_types.h"

namespace BlinkMonitor
{
    // Anything that maps an image to per-face keypoint detections
    class LandmarkDetector
    {
    public:
        virtual ~LandmarkDetector() = default;

        virtual bool initialize() = 0;
        virtual bool isInitialized() const = 0;

        // May throw on inference failure
        virtual std::vector<RawDetection> estimate(const cv::Mat &image) = 0;
    };
}

#endif // LANDMARK_DETECTOR_H
