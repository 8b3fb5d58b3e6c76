#ifndef FACE_TYPES_H
#define FACE_TYPES_H

#include <optional>
#include <vector>
#include <opencv2/core.hpp>

namespace BlinkMonitor
{
    using Point = cv::Point2f;

    // What a landmark detector hands back for one face
    struct RawDetection
    {
        std::optional<float> probability;
        Point top_left;
        Point bottom_right;
        std::vector<Point> keypoints; // right eye, left eye, nose, mouth, right ear, left ear
    };

    struct FaceBounds
    {
        Point top_left;
        Point bottom_right;
        float width = 0.0f;
        float height = 0.0f;
    };

    struct FaceLandmarks
    {
        Point right_eye;
        Point left_eye;
        Point nose_tip;
        Point mouth_center;
        Point right_ear_tragion;
        Point left_ear_tragion;
    };

    struct FaceGeometry
    {
        FaceBounds bounds;
        FaceLandmarks landmarks;
        float probability = 0.0f;
        double left_eye_open_probability = 0.0;
        double right_eye_open_probability = 0.0;
    };
}

#endif // FACE_TYPES_H
