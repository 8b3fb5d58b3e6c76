#include "../include/config.h"
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace BlinkMonitor
{
    void Thresholds::validate() const
    {
        if (!(open_ratio > closed_ratio))
            throw std::invalid_argument("Thresholds: open_ratio must be greater than closed_ratio");
        if (window_ms <= 0)
            throw std::invalid_argument("Thresholds: window_ms must be positive");
        if (min_blink_interval_ms < 0)
            throw std::invalid_argument("Thresholds: min_blink_interval_ms must not be negative");
    }

    namespace
    {
        template <typename T>
        void readField(const nlohmann::json &json, const char *key, T &field)
        {
            if (json.contains(key))
                field = json.at(key).get<T>();
        }

        void readColor(const nlohmann::json &json, const char *key, cv::Scalar &color)
        {
            if (!json.contains(key))
                return;
            const auto &bgr = json.at(key);
            if (!bgr.is_array() || bgr.size() != 3)
                throw std::runtime_error(std::string("Config: '") + key + "' must be a [b, g, r] array");
            color = cv::Scalar(bgr[0].get<double>(), bgr[1].get<double>(), bgr[2].get<double>());
        }
    }

    Config loadConfig(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
            throw std::runtime_error("Config: cannot open " + path);

        Config config;
        try
        {
            nlohmann::json json = nlohmann::json::parse(file);

            if (json.contains("thresholds"))
            {
                const auto &t = json.at("thresholds");
                readField(t, "eye_closure_threshold", config.thresholds.eye_closure_threshold);
                readField(t, "closed_ratio", config.thresholds.closed_ratio);
                readField(t, "open_ratio", config.thresholds.open_ratio);
                readField(t, "window_ms", config.thresholds.window_ms);
                readField(t, "average_blink_duration_ms", config.thresholds.average_blink_duration_ms);
                readField(t, "min_blink_interval_ms", config.thresholds.min_blink_interval_ms);
            }

            readField(json, "camera_index", config.camera_index);
            readField(json, "video_path", config.video_path);
            readField(json, "model_path", config.model_path);
            readField(json, "frame_skip", config.frame_skip);

            readField(json, "enable_low_rate_alert", config.enable_low_rate_alert);
            readField(json, "low_rate_grace_seconds", config.low_rate_grace_seconds);

            readField(json, "enable_console_logging", config.enable_console_logging);
            readField(json, "enable_file_logging", config.enable_file_logging);
            readField(json, "enable_file_logging_json", config.enable_file_logging_json);
            readField(json, "save_snapshots", config.save_snapshots);
            readField(json, "snapshot_path", config.snapshot_path);
            readField(json, "log_path", config.log_path);
            readField(json, "log_filename", config.log_filename);

            readField(json, "zmq_endpoint", config.zmq_endpoint);
            readField(json, "enable_publishing", config.enable_publishing_);

            readField(json, "show_window", config.show_window);
            readField(json, "show_debug_info", config.show_debug_info);
            readField(json, "show_keypoints", config.show_keypoints);
            readColor(json, "normal_color", config.normal_color);
            readColor(json, "warning_color", config.warning_color);
            readColor(json, "danger_color", config.danger_color);
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("Config: invalid JSON in " + path + ": " + e.what());
        }

        if (config.frame_skip < 1)
            throw std::invalid_argument("Config: frame_skip must be at least 1");
        config.thresholds.validate();
        return config;
    }
}
