#include "../include/facial_landmark_detector.h"
#include "../include/constants.h"
#include <iostream>

namespace BlinkMonitor
{
    FacialLandmarkDetector::FacialLandmarkDetector(const std::string &model_path)
        : model_path_(model_path)
    {
    }

    bool FacialLandmarkDetector::initialize()
    {
        try
        {
            face_detector_ = dlib::get_frontal_face_detector();
            dlib::deserialize(model_path_) >> landmark_predictor_;
            is_initialized_ = true;
            std::cout << "FacialLandmarkDetector: Loaded " << model_path_ << std::endl;
            return true;
        }
        catch (const std::exception &e)
        {
            std::cerr << "Failed to initialize face detector: " << e.what() << std::endl;
            is_initialized_ = false;
            return false;
        }
    }

    std::vector<RawDetection> FacialLandmarkDetector::estimate(const cv::Mat &image)
    {
        std::vector<RawDetection> detections;
        if (!is_initialized_ || image.empty())
            return detections;

        dlib::cv_image<dlib::bgr_pixel> dlib_img(image);
        std::vector<dlib::rectangle> faces = face_detector_(dlib_img);

        for (const auto &face : faces)
        {
            dlib::full_object_detection landmarks = landmark_predictor_(dlib_img, face);
            if (landmarks.num_parts() != LandmarkIndices::FACE_LANDMARK_COUNT)
                continue;
            detections.push_back(toRawDetection(face, landmarks));
        }
        return detections;
    }

    RawDetection FacialLandmarkDetector::toRawDetection(const dlib::rectangle &face,
                                                        const dlib::full_object_detection &landmarks) const
    {
        RawDetection detection;
        // HOG scores are not probabilities, so leave it unset
        detection.top_left = Point(static_cast<float>(face.left()), static_cast<float>(face.top()));
        detection.bottom_right = Point(static_cast<float>(face.right()), static_cast<float>(face.bottom()));

        detection.keypoints.reserve(KeypointIndices::KEYPOINT_COUNT);
        detection.keypoints.push_back(meanPoint(landmarks, LandmarkIndices::RIGHT_EYE_START, LandmarkIndices::RIGHT_EYE_END));
        detection.keypoints.push_back(meanPoint(landmarks, LandmarkIndices::LEFT_EYE_START, LandmarkIndices::LEFT_EYE_END));
        detection.keypoints.push_back(toPoint(landmarks.part(LandmarkIndices::NOSE_TIP)));
        detection.keypoints.push_back(meanPoint(landmarks, LandmarkIndices::MOUTH_START, LandmarkIndices::MOUTH_END));
        detection.keypoints.push_back(toPoint(landmarks.part(LandmarkIndices::RIGHT_JAW_TOP)));
        detection.keypoints.push_back(toPoint(landmarks.part(LandmarkIndices::LEFT_JAW_TOP)));
        return detection;
    }

    Point FacialLandmarkDetector::meanPoint(const dlib::full_object_detection &landmarks, int start, int end)
    {
        Point sum(0.0f, 0.0f);
        for (int i = start; i <= end; ++i)
        {
            sum += toPoint(landmarks.part(i));
        }
        return sum * (1.0f / static_cast<float>(end - start + 1));
    }

    Point FacialLandmarkDetector::toPoint(const dlib::point &p)
    {
        return Point(static_cast<float>(p.x()), static_cast<float>(p.y()));
    }
}
