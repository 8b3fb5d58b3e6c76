#ifndef BLINK_MONITOR_SYSTEM_H
#define BLINK_MONITOR_SYSTEM_H

#include <memory>
#include <optional>
#include <opencv2/opencv.hpp>
#include "config.h"
#include "blink_detector.h"
#include "face_detection_service.h"
#include "monitor_state.h"

namespace BlinkMonitor
{
    class BlinkMonitorSystem
    {
    private:
        Config config_;
        std::unique_ptr<FaceDetectionService> detection_service_;
        std::unique_ptr<BlinkDetector> blink_detector_;
        bool face_was_visible_ = true;
        std::optional<BlinkRateStatus> last_alerted_status_;

    public:
        explicit BlinkMonitorSystem(const Config &config);
        BlinkMonitorSystem(const Config &config, std::unique_ptr<LandmarkDetector> detector);

        bool initialize();
        int run();

        // One frame through detection, blink tracking and logging. Draws the
        // overlay onto frame. Returns false when no face was found.
        bool processFrame(cv::Mat &frame, TimePoint now);

        void resetSession(TimePoint now);

        const BlinkDetector &getBlinkDetector() const { return *blink_detector_; }

        // Band seen by the last alert check; empty until the grace period has passed
        std::optional<BlinkRateStatus> getLastRateStatus() const { return last_alerted_status_; }

    private:
        void checkBlinkRate(const BlinkStats &stats, const cv::Mat &frame);
        void drawNoFaceDetected(cv::Mat &frame);
        void drawVisualization(cv::Mat &frame, const FaceGeometry &face, const BlinkStats &stats);
        void drawKeypoints(cv::Mat &frame, const FaceLandmarks &landmarks);
        static const FaceGeometry &selectLargestFace(const std::vector<FaceGeometry> &faces);
        void cleanup();
    };
}

#endif // BLINK_MONITOR_SYSTEM_H
