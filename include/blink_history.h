#ifndef BLINK_HISTORY_H
#define BLINK_HISTORY_H

#include <chrono>
#include <deque>
#include <optional>

namespace BlinkMonitor
{
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    // Per-eye state at the instant the blink was detected
    struct BlinkEvent
    {
        TimePoint timestamp;
        bool left_eye_open;
        bool right_eye_open;
    };

    /**
     * @brief Time-ordered log of blink events bounded by a retention window
     *
     * Events are appended with a non-decreasing timestamp and leave only
     * through prune() or clear(). Queries never prune.
     */
    class BlinkHistory
    {
    private:
        std::deque<BlinkEvent> events_;
        std::chrono::milliseconds window_;

    public:
        explicit BlinkHistory(std::chrono::milliseconds window);

        void append(const BlinkEvent &event);

        // Drops every event with now - timestamp >= window
        void prune(TimePoint now);

        // Events with now - timestamp < span
        int countWithin(TimePoint now, std::chrono::milliseconds span) const;

        int size() const { return static_cast<int>(events_.size()); }
        bool empty() const { return events_.empty(); }
        int leftEyeClosedCount() const;
        int rightEyeClosedCount() const;
        std::optional<TimePoint> lastTimestamp() const;

        void clear() { events_.clear(); }

        std::chrono::milliseconds window() const { return window_; }
        const std::deque<BlinkEvent> &events() const { return events_; }
    };
}

#endif // BLINK_HISTORY_H
