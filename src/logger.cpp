#include "../include/logger.h"
#include "../include/constants.h"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace BlinkMonitor
{
    // Static member definitions
    std::unique_ptr<Logger> Logger::instance_ = nullptr;
    std::once_flag Logger::once_flag_;
    std::mutex Logger::instance_mutex_;

    LogEntry::LogEntry(MonitorEvent e, const std::string &msg, double left, double right,
                       int rate, int total, const std::string &img)
        : timestamp(std::chrono::system_clock::now()), event(e), message(msg),
          left_open(left), right_open(right), blink_rate(rate), total_blinks(total),
          image_filename(img) {}

    Logger &Logger::getInstance()
    {
        std::call_once(once_flag_, []()
                       { instance_ = std::unique_ptr<Logger>(new Logger()); });
        return *instance_;
    }

    void Logger::setupConfig(const Config &config)
    {
        std::lock_guard<std::mutex> lock(instance_mutex_);

        if (is_initialized_)
        {
            std::cerr << "Warning: Logger already initialized. Config changes ignored." << "\n";
            return;
        }

        config_ = config;
        total_events_logged_ = 0;
        images_saved_ = 0;
        message_publisher_.reset();
        setupDirectories();

        if (config_.enable_publishing_)
        {
            message_publisher_ = std::make_unique<MessagePublisher>();
            if (!message_publisher_->initialize(config_.zmq_endpoint))
            {
                std::cerr << "Logger: Failed to initialize ZeroMQ publisher, continuing without publishing" << "\n";
                message_publisher_.reset();
            }
            else
            {
                std::cout << "Logger: ZeroMQ publishing enabled on " << config_.zmq_endpoint << "\n";
            }
        }

        if (config_.enable_file_logging || message_publisher_)
        {
            should_stop_ = false;
            worker_thread_ = std::thread(&Logger::processLogQueue, this);
        }

        is_initialized_ = true;
        std::cout << "Logger initialized successfully" << "\n";
    }

    void Logger::log(MonitorEvent event, const std::string &message, double left_open, double right_open,
                     int blink_rate, int total_blinks, const cv::Mat &frame)
    {
        Logger &logger = getInstance();
        if (!logger.is_initialized_)
        {
            std::cerr << "Error: Logger not initialized. Call setupConfig() first." << "\n";
            return;
        }

        logger.logImpl(event, message, left_open, right_open, blink_rate, total_blinks, frame);
    }

    void Logger::shutdown()
    {
        std::lock_guard<std::mutex> lock(instance_mutex_);
        if (instance_ && instance_->is_initialized_)
        {
            instance_->shutdownImpl();
        }
    }

    Logger::~Logger()
    {
        if (is_initialized_)
        {
            shutdownImpl();
        }
    }

    void Logger::shutdownImpl()
    {
        should_stop_ = true;
        if (worker_thread_.joinable())
        {
            worker_thread_.join();
        }
        is_initialized_ = false;

        if (message_publisher_)
        {
            message_publisher_->shutdown();
        }

        std::cout << "Logger shutdown complete" << "\n";
    }

    void Logger::logImpl(MonitorEvent event, const std::string &message, double left_open, double right_open,
                         int blink_rate, int total_blinks, const cv::Mat &frame)
    {
        std::string image_filename;
        if (config_.save_snapshots && !frame.empty() && event == MonitorEvent::LOW_BLINK_RATE)
        {
            image_filename = saveSnapshot(frame);
        }
        if (!image_filename.empty())
            images_saved_++;

        LogEntry entry(event, message, left_open, right_open, blink_rate, total_blinks, image_filename);

        if (config_.enable_console_logging)
            printToConsole(entry);

        if (worker_thread_.joinable())
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            log_queue_.push(entry);

            // Prevent queue from growing too large
            while (log_queue_.size() > static_cast<size_t>(Constants::MAX_LOG_ENTRIES))
            {
                log_queue_.pop();
            }
        }
    }

    void Logger::setupDirectories()
    {
        if (config_.save_snapshots && !std::filesystem::exists(config_.snapshot_path))
        {
            std::filesystem::create_directories(config_.snapshot_path);
        }
        if (config_.enable_file_logging && !std::filesystem::exists(config_.log_path))
        {
            std::filesystem::create_directories(config_.log_path);
        }
    }

    std::string Logger::GetCurrentTimeStamp()
    {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
        std::stringstream ss;

        ss << std::put_time(std::localtime(&time_t), "%b%d_%Y_%Hh%Mm%Ss");
        ss << "_" << std::setw(3) << std::setfill('0') << ms.count();
        return ss.str();
    }

    std::string Logger::saveSnapshot(const cv::Mat &frame)
    {
        std::string filename = config_.snapshot_path + "low_blink_rate_" + GetCurrentTimeStamp() + ".jpg";
        if (cv::imwrite(filename, frame))
        {
            return filename;
        }
        std::cerr << "Logger: Error saving image " << filename << std::endl;
        return "";
    }

    void Logger::printToConsole(const LogEntry &entry)
    {
        std::cout << formatLogTimestamp(entry.timestamp)
                  << " | " << eventToString(entry.event)
                  << " | L: " << std::fixed << std::setprecision(3) << entry.left_open
                  << " | R: " << std::fixed << std::setprecision(3) << entry.right_open
                  << " | Rate: " << entry.blink_rate << "/min"
                  << " | Total: " << entry.total_blinks
                  << " | " << entry.message << "\n";
    }

    void Logger::processLogQueue()
    {
        std::ofstream log_file;
        if (config_.enable_file_logging)
        {
            log_file.open(config_.log_path + config_.log_filename, std::ios::app);
            if (!log_file.is_open())
                std::cerr << "Logger: Cannot open " << config_.log_path + config_.log_filename << std::endl;
        }

        while (true)
        {
            std::queue<LogEntry> temp_queue;
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                temp_queue.swap(log_queue_);
            }

            if (temp_queue.empty() && should_stop_)
                break;

            while (!temp_queue.empty())
            {
                const auto &entry = temp_queue.front();
                writeToFile(log_file, entry);
                total_events_logged_++;
                if (message_publisher_)
                    publishMessage(LogEntryToJsonString(entry));
                temp_queue.pop();
            }

            if (log_file.is_open())
                log_file.flush();
            if (!should_stop_)
                std::this_thread::sleep_for(std::chrono::milliseconds(400));
        }
    }

    void Logger::publishMessage(const std::string &json_entry)
    {
        if (message_publisher_ && message_publisher_->isReady())
        {
            message_publisher_->publishMessage(json_entry);
        }
    }

    void Logger::getStats(size_t &events_logged, size_t &images_saved,
                          size_t &messages_sent, size_t &messages_failed) const
    {
        events_logged = total_events_logged_;
        images_saved = images_saved_;

        if (message_publisher_)
        {
            message_publisher_->getStats(messages_sent, messages_failed);
        }
        else
        {
            messages_sent = 0;
            messages_failed = 0;
        }
    }

    std::string Logger::formatLogTimestamp(const std::chrono::system_clock::time_point &tp)
    {
        std::time_t time_t = std::chrono::system_clock::to_time_t(tp);
        std::stringstream ss;
        ss << std::put_time(std::localtime(&time_t), "%b%d_%Y_%Hh%Mm%Ss");
        return ss.str();
    }

    std::string Logger::LogEntryToJsonString(const LogEntry &entry)
    {
        nlohmann::json log_json;
        log_json["timestamp"] = formatLogTimestamp(entry.timestamp);
        log_json["event"] = eventToString(entry.event);
        log_json["left_open"] = entry.left_open;
        log_json["right_open"] = entry.right_open;
        log_json["blink_rate"] = entry.blink_rate;
        log_json["total_blinks"] = entry.total_blinks;
        log_json["message"] = entry.message;
        if (!entry.image_filename.empty())
            log_json["image"] = entry.image_filename;

        return log_json.dump();
    }

    void Logger::writeToFile(std::ofstream &file, const LogEntry &entry)
    {
        if (!file.is_open())
            return;
        if (config_.enable_file_logging_json)
        {
            file << LogEntryToJsonString(entry) << "\n";
        }
        else
        {
            file << formatLogTimestamp(entry.timestamp)
                 << " | Event: " << eventToString(entry.event)
                 << " | Left: " << entry.left_open
                 << " | Right: " << entry.right_open
                 << " | Rate: " << entry.blink_rate
                 << " | Total: " << entry.total_blinks
                 << " | Message: " << entry.message;

            if (!entry.image_filename.empty())
                file << " | Image: " << entry.image_filename;

            file << "\n";
        }
    }
}
