#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <chrono>
#include <queue>
#include <mutex>
#include <thread>
#include <atomic>
#include <memory>
#include <fstream>
#include <opencv2/opencv.hpp>
#include "monitor_state.h"
#include "config.h"
#include "message_publisher.h"

namespace BlinkMonitor
{
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        MonitorEvent event;
        std::string message;
        double left_open;
        double right_open;
        int blink_rate;
        int total_blinks;
        std::string image_filename;
        LogEntry(MonitorEvent e, const std::string &msg, double left, double right,
                 int rate, int total, const std::string &img = "");
    };

    class Logger
    {
    private:
        // Static members for singleton
        static std::unique_ptr<Logger> instance_;
        static std::once_flag once_flag_;
        static std::mutex instance_mutex_;

        std::unique_ptr<MessagePublisher> message_publisher_;

        // Statistics
        std::atomic<size_t> total_events_logged_;
        std::atomic<size_t> images_saved_;

        std::queue<LogEntry> log_queue_;
        std::mutex queue_mutex_;
        std::thread worker_thread_;
        std::atomic<bool> should_stop_{false};
        Config config_;
        bool is_initialized_{false};

        Logger() : message_publisher_(nullptr), total_events_logged_(0),
                   images_saved_(0) {}

        Logger(const Logger &) = delete;
        Logger &operator=(const Logger &) = delete;
        Logger(Logger &&) = delete;
        Logger &operator=(Logger &&) = delete;

    public:
        static Logger &getInstance();

        // Must be called before log(); ignored until shutdown() has run
        void setupConfig(const Config &config);

        static void log(MonitorEvent event, const std::string &message,
                        double left_open, double right_open,
                        int blink_rate, int total_blinks, const cv::Mat &frame);

        void getStats(size_t &events_logged, size_t &images_saved,
                      size_t &messages_sent, size_t &messages_failed) const;

        static void shutdown();

        ~Logger();

        // One JSON line, as written to the log file and published over ZeroMQ
        static std::string LogEntryToJsonString(const LogEntry &entry);
        static std::string formatLogTimestamp(const std::chrono::system_clock::time_point &tp);

    private:
        void shutdownImpl();
        void logImpl(MonitorEvent event, const std::string &message, double left_open, double right_open,
                     int blink_rate, int total_blinks, const cv::Mat &frame);

        void setupDirectories();
        std::string GetCurrentTimeStamp();
        std::string saveSnapshot(const cv::Mat &frame);
        void printToConsole(const LogEntry &entry);
        void processLogQueue();
        void writeToFile(std::ofstream &file, const LogEntry &entry);
        void publishMessage(const std::string &json_entry);
    };
}

#endif // LOGGER_H
