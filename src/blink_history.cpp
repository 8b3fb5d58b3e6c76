#include "../include/blink_history.h"
#include <algorithm>

namespace BlinkMonitor
{
    BlinkHistory::BlinkHistory(std::chrono::milliseconds window)
        : window_(window)
    {
    }

    void BlinkHistory::append(const BlinkEvent &event)
    {
        events_.push_back(event);
    }

    void BlinkHistory::prune(TimePoint now)
    {
        // Oldest first, so stale entries are always at the front
        while (!events_.empty() && now - events_.front().timestamp >= window_)
        {
            events_.pop_front();
        }
    }

    int BlinkHistory::countWithin(TimePoint now, std::chrono::milliseconds span) const
    {
        return static_cast<int>(std::count_if(events_.begin(), events_.end(),
                                              [&](const BlinkEvent &event)
                                              {
                                                  return now - event.timestamp < span;
                                              }));
    }

    int BlinkHistory::leftEyeClosedCount() const
    {
        return static_cast<int>(std::count_if(events_.begin(), events_.end(),
                                              [](const BlinkEvent &event)
                                              { return !event.left_eye_open; }));
    }

    int BlinkHistory::rightEyeClosedCount() const
    {
        return static_cast<int>(std::count_if(events_.begin(), events_.end(),
                                              [](const BlinkEvent &event)
                                              { return !event.right_eye_open; }));
    }

    std::optional<TimePoint> BlinkHistory::lastTimestamp() const
    {
        if (events_.empty())
            return std::nullopt;
        return events_.back().timestamp;
    }
}
