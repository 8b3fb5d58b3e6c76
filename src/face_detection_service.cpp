#include "../include/face_detection_service.h"
#include "../include/errors.h"
#include "../include/geometry_extractor.h"
#include <iostream>

namespace BlinkMonitor
{
    FaceDetectionService::FaceDetectionService(std::unique_ptr<LandmarkDetector> detector,
                                               const Thresholds &thresholds)
        : detector_(std::move(detector)),
          thresholds_(thresholds)
    {
        thresholds_.validate();
    }

    bool FaceDetectionService::initialize()
    {
        if (!detector_)
        {
            std::cerr << "FaceDetectionService: No landmark detector supplied" << std::endl;
            return false;
        }

        bool ready = detector_->initialize();
        if (ready)
            std::cout << "FaceDetectionService: Landmark detector ready" << std::endl;
        else
            std::cerr << "FaceDetectionService: Landmark detector failed to load" << std::endl;
        return ready;
    }

    std::vector<FaceGeometry> FaceDetectionService::detectFaces(const cv::Mat &image)
    {
        if (!isInitialized())
        {
            throw NotInitializedError("Face detection service not initialized");
        }

        std::vector<RawDetection> detections;
        try
        {
            detections = detector_->estimate(image);
        }
        catch (const std::exception &e)
        {
            // Dropping one frame is preferable to stopping the monitoring loop
            std::cerr << "Error detecting faces: " << e.what() << std::endl;
            return {};
        }

        return GeometryExtractor::extractGeometry(detections, thresholds_);
    }

    void FaceDetectionService::dispose()
    {
        detector_.reset();
    }
}
