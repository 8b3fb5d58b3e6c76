#include "../include/geometry_extractor.h"
#include "../include/constants.h"
#include "../include/errors.h"
#include <algorithm>
#include <iostream>

namespace BlinkMonitor
{
    namespace GeometryExtractor
    {
        double calculateOpenness(const Point &eye_point, const Point &ear_point, const Point &nose_tip,
                                 double closed_ratio, double open_ratio)
        {
            double eye_to_ear = cv::norm(eye_point - ear_point);
            double eye_to_nose = cv::norm(eye_point - nose_tip);

            double ratio = eye_to_nose / (eye_to_ear + Constants::OPENNESS_EPSILON);
            double probability = (ratio - closed_ratio) / (open_ratio - closed_ratio);
            return std::clamp(probability, 0.0, 1.0);
        }

        FaceGeometry extract(const RawDetection &detection, const Thresholds &thresholds)
        {
            if (detection.keypoints.size() < static_cast<size_t>(KeypointIndices::KEYPOINT_COUNT))
            {
                throw MalformedDetectionError("Detection has " + std::to_string(detection.keypoints.size()) +
                                                  " keypoints, expected " +
                                                  std::to_string(KeypointIndices::KEYPOINT_COUNT),
                                              detection.keypoints.size());
            }

            FaceGeometry geometry;
            geometry.bounds.top_left = detection.top_left;
            geometry.bounds.bottom_right = detection.bottom_right;
            geometry.bounds.width = detection.bottom_right.x - detection.top_left.x;
            geometry.bounds.height = detection.bottom_right.y - detection.top_left.y;

            const std::vector<Point> &kp = detection.keypoints;
            geometry.landmarks.right_eye = kp[KeypointIndices::RIGHT_EYE];
            geometry.landmarks.left_eye = kp[KeypointIndices::LEFT_EYE];
            geometry.landmarks.nose_tip = kp[KeypointIndices::NOSE_TIP];
            geometry.landmarks.mouth_center = kp[KeypointIndices::MOUTH_CENTER];
            geometry.landmarks.right_ear_tragion = kp[KeypointIndices::RIGHT_EAR_TRAGION];
            geometry.landmarks.left_ear_tragion = kp[KeypointIndices::LEFT_EAR_TRAGION];

            geometry.probability = detection.probability.value_or(Constants::DEFAULT_DETECTION_PROBABILITY);

            geometry.left_eye_open_probability = calculateOpenness(
                geometry.landmarks.left_eye, geometry.landmarks.left_ear_tragion, geometry.landmarks.nose_tip,
                thresholds.closed_ratio, thresholds.open_ratio);
            geometry.right_eye_open_probability = calculateOpenness(
                geometry.landmarks.right_eye, geometry.landmarks.right_ear_tragion, geometry.landmarks.nose_tip,
                thresholds.closed_ratio, thresholds.open_ratio);

            return geometry;
        }

        std::vector<FaceGeometry> extractGeometry(const std::vector<RawDetection> &detections,
                                                  const Thresholds &thresholds)
        {
            std::vector<FaceGeometry> faces;
            faces.reserve(detections.size());

            for (const auto &detection : detections)
            {
                try
                {
                    faces.push_back(extract(detection, thresholds));
                }
                catch (const MalformedDetectionError &e)
                {
                    std::cerr << "GeometryExtractor: Skipping detection: " << e.what() << std::endl;
                }
            }
            return faces;
        }
    }
}
