#ifndef CONFIG_H
#define CONFIG_H

#include <string>
#include <opencv2/opencv.hpp>

namespace BlinkMonitor
{
    // Engine thresholds. Fixed for the lifetime of a session.
    struct Thresholds
    {
        double eye_closure_threshold = 0.4; // open probability at or below this is "closed"
        double closed_ratio = 0.3;          // ratio mapped to openness 0
        double open_ratio = 0.5;            // ratio mapped to openness 1
        long long window_ms = 60000;        // history retention
        double average_blink_duration_ms = 150.0;
        long long min_blink_interval_ms = 0; // 0 disables the re-blink guard

        // Throws std::invalid_argument on an unusable combination
        void validate() const;
    };

    struct Config
    {
        Thresholds thresholds;

        // Input
        int camera_index = 0;
        std::string video_path = "";
        std::string model_path = "models/shape_predictor_68_face_landmarks.dat";
        int frame_skip = 1; // Process every N frames

        // Alerting
        bool enable_low_rate_alert = true;
        double low_rate_grace_seconds = 60.0; // rate is not meaningful before one full minute

        // logging options
        bool enable_console_logging = true;
        bool enable_file_logging = true;
        bool enable_file_logging_json = true;
        bool save_snapshots = false;

        // Paths
        std::string snapshot_path = "snapshots/";
        std::string log_path = "logs/";
        std::string log_filename = "blink_log.jsonl";

        // Zero Mq Configurations
        std::string zmq_endpoint = "tcp://*:5556";
        bool enable_publishing_ = false;

        // Display settings
        bool show_window = true;
        bool show_debug_info = true;
        bool show_keypoints = true;
        cv::Scalar normal_color = cv::Scalar(0, 255, 0);
        cv::Scalar warning_color = cv::Scalar(0, 165, 255);
        cv::Scalar danger_color = cv::Scalar(0, 0, 255);
    };

    // Reads a JSON object from path. Absent keys keep their defaults.
    Config loadConfig(const std::string &path);
}

#endif // CONFIG_H
