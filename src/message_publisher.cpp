#include "../include/message_publisher.h"
#include <iostream>

namespace BlinkMonitor
{
    MessagePublisher::MessagePublisher()
        : context_(nullptr),
          publisher_(nullptr),
          endpoint_(""),
          topic_(DEFAULT_TOPIC),
          is_initialized_(false),
          messages_sent_(0),
          failed_sends_(0)
    {
    }

    MessagePublisher::~MessagePublisher()
    {
        shutdown();
    }

    bool MessagePublisher::initialize(const std::string &endpoint, const std::string &topic)
    {
        std::lock_guard<std::mutex> lock(publisher_mutex_);

        try
        {
            if (is_initialized_)
            {
                closeSocket();
            }

            endpoint_ = endpoint;
            topic_ = topic;

            context_ = std::make_unique<zmq::context_t>(1);
            publisher_ = std::make_unique<zmq::socket_t>(*context_, ZMQ_PUB);

            int linger = 1000;
            publisher_->setsockopt(ZMQ_LINGER, &linger, sizeof(linger));

            int hwm = 1000;
            publisher_->setsockopt(ZMQ_SNDHWM, &hwm, sizeof(hwm));

            publisher_->bind(endpoint_);

            is_initialized_ = true;
            messages_sent_ = 0;
            failed_sends_ = 0;

            std::cout << "MessagePublisher: Publishing '" << topic_ << "' on " << endpoint_ << std::endl;
            return true;
        }
        catch (const zmq::error_t &e)
        {
            std::cerr << "MessagePublisher: ZeroMQ error during initialization: " << e.what() << std::endl;
            publisher_.reset();
            context_.reset();
            is_initialized_ = false;
            return false;
        }
    }

    bool MessagePublisher::publishMessage(const std::string &json_message)
    {
        std::lock_guard<std::mutex> lock(publisher_mutex_);

        if (!is_initialized_ || !publisher_)
        {
            failed_sends_++;
            return false;
        }

        try
        {
            zmq::message_t topic_frame(topic_.data(), topic_.size());
            zmq::message_t payload(json_message.data(), json_message.size());

            zmq::send_result_t topic_result =
                publisher_->send(topic_frame, zmq::send_flags::sndmore | zmq::send_flags::dontwait);
            if (!topic_result.has_value())
            {
                failed_sends_++;
                std::cerr << "MessagePublisher: Send would block - message queue full" << std::endl;
                return false;
            }

            zmq::send_result_t payload_result = publisher_->send(payload, zmq::send_flags::dontwait);
            if (!payload_result.has_value())
            {
                failed_sends_++;
                std::cerr << "MessagePublisher: Payload frame dropped" << std::endl;
                return false;
            }
            messages_sent_++;
            return true;
        }
        catch (const zmq::error_t &e)
        {
            failed_sends_++;
            std::cerr << "MessagePublisher: ZeroMQ error during send: " << e.what() << std::endl;
            return false;
        }
    }

    bool MessagePublisher::isReady() const
    {
        std::lock_guard<std::mutex> lock(publisher_mutex_);
        return is_initialized_ && publisher_ != nullptr;
    }

    void MessagePublisher::getStats(size_t &sent, size_t &failed) const
    {
        std::lock_guard<std::mutex> lock(publisher_mutex_);
        sent = messages_sent_;
        failed = failed_sends_;
    }

    void MessagePublisher::shutdown()
    {
        std::lock_guard<std::mutex> lock(publisher_mutex_);
        if (!is_initialized_)
            return;

        closeSocket();
        std::cout << "MessagePublisher: Shutdown complete. Stats - Sent: "
                  << messages_sent_ << ", Failed: " << failed_sends_ << std::endl;
    }

    void MessagePublisher::closeSocket()
    {
        try
        {
            if (publisher_)
            {
                publisher_->close();
                publisher_.reset();
            }
            if (context_)
            {
                context_->close();
                context_.reset();
            }
        }
        catch (const zmq::error_t &e)
        {
            std::cerr << "MessagePublisher: Error during shutdown: " << e.what() << std::endl;
        }
        is_initialized_ = false;
    }
}
