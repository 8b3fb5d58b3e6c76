#ifndef FACIAL_LANDMARK_DETECTOR_H
#define FACIAL_LANDMARK_DETECTOR_H

#include <string>
#include <vector>
#include <opencv2/opencv.hpp>
#include <dlib/opencv.h>
#include <dlib/image_processing/frontal_face_detector.h>
#include <dlib/image_processing.h>
#include "landmark_detector.h"

namespace BlinkMonitor
{
    // dlib HOG face detector plus 68-point shape predictor, reduced to six keypoints
    class FacialLandmarkDetector : public LandmarkDetector
    {
    private:
        dlib::frontal_face_detector face_detector_;
        dlib::shape_predictor landmark_predictor_;
        std::string model_path_;
        bool is_initialized_ = false;

    public:
        explicit FacialLandmarkDetector(const std::string &model_path);

        bool initialize() override;
        bool isInitialized() const override { return is_initialized_; }
        std::vector<RawDetection> estimate(const cv::Mat &image) override;

    private:
        RawDetection toRawDetection(const dlib::rectangle &face,
                                    const dlib::full_object_detection &landmarks) const;
        static Point meanPoint(const dlib::full_object_detection &landmarks, int start, int end);
        static Point toPoint(const dlib::point &p);
    };
}

#endif // FACIAL_LANDMARK_DETECTOR_H
