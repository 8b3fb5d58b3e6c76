#pragma once

#include <zmq.hpp>
#include <string>
#include <memory>
#include <mutex>

namespace BlinkMonitor
{
    /**
     * @brief Publishes blink monitor events on a ZeroMQ PUB socket
     *
     * Every message is two frames: the topic, then the JSON payload.
     * Subscribers filter on the topic prefix.
     */
    class MessagePublisher
    {
    private:
        std::unique_ptr<zmq::context_t> context_;
        std::unique_ptr<zmq::socket_t> publisher_;
        std::string endpoint_;
        std::string topic_;
        bool is_initialized_;
        mutable std::mutex publisher_mutex_;

        size_t messages_sent_;
        size_t failed_sends_;

        void closeSocket();

    public:
        static constexpr const char *DEFAULT_TOPIC = "blink_monitor";

        MessagePublisher();
        ~MessagePublisher();

        /**
         * @brief Bind the publisher socket
         * @param endpoint ZeroMQ endpoint (e.g., "tcp://*:5556" or "ipc:///tmp/blink_events")
         * @param topic First frame of every published message
         * @return true if successful, false otherwise
         */
        bool initialize(const std::string &endpoint, const std::string &topic = DEFAULT_TOPIC);

        /**
         * @brief Publish a JSON message without blocking
         * @return false if not initialized or the send queue is full
         */
        bool publishMessage(const std::string &json_message);

        bool isReady() const;

        void getStats(size_t &sent, size_t &failed) const;

        void shutdown();

        MessagePublisher(const MessagePublisher &) = delete;
        MessagePublisher &operator=(const MessagePublisher &) = delete;
    };
}
