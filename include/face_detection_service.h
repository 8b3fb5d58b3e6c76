#ifndef FACE_DETECTION_SERVICE_H
#define FACE_DETECTION_SERVICE_H

#include <memory>
#include <vector>
#include <opencv2/core.hpp>
#include "config.h"
#include "face_types.h"
#include "landmark_detector.h"

namespace BlinkMonitor
{
    /**
     * @brief Runs a LandmarkDetector and turns its output into FaceGeometry
     *
     * Detection is best effort: a failed load is reported through
     * initialize()'s return value and a failing frame yields no faces.
     */
    class FaceDetectionService
    {
    private:
        std::unique_ptr<LandmarkDetector> detector_;
        Thresholds thresholds_;

    public:
        // Throws std::invalid_argument on unusable thresholds
        FaceDetectionService(std::unique_ptr<LandmarkDetector> detector, const Thresholds &thresholds);

        /**
         * @brief Load the underlying detector
         * @return false if the detector could not be loaded
         */
        bool initialize();

        /**
         * @brief Detect faces and derive per-eye openness
         * @throws NotInitializedError if initialize() has not succeeded
         * @return One entry per well-formed detection; empty on inference failure
         */
        std::vector<FaceGeometry> detectFaces(const cv::Mat &image);

        bool isInitialized() const { return detector_ && detector_->isInitialized(); }

        void dispose();

        FaceDetectionService(const FaceDetectionService &) = delete;
        FaceDetectionService &operator=(const FaceDetectionService &) = delete;
    };
}

#endif // FACE_DETECTION_SERVICE_H
