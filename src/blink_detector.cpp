#include "../include/blink_detector.h"
#include "../include/constants.h"

namespace BlinkMonitor
{
    namespace
    {
        const Thresholds &validated(const Thresholds &thresholds)
        {
            thresholds.validate();
            return thresholds;
        }
    }

    BlinkDetector::BlinkDetector(const Thresholds &thresholds, TimePoint session_start)
        : thresholds_(validated(thresholds)),
          history_(std::chrono::milliseconds(thresholds.window_ms)),
          session_start_(session_start)
    {
    }

    BlinkResult BlinkDetector::observe(double left_open_prob, double right_open_prob, TimePoint now)
    {
        EyeState current = classifyEyes(left_open_prob, right_open_prob, thresholds_.eye_closure_threshold);
        BlinkResult result = detectFallingEdges(eye_state_, current);
        eye_state_ = current;

        if (result.any_blink && withinMinInterval(now))
        {
            return BlinkResult{};
        }

        if (result.any_blink)
        {
            history_.append(BlinkEvent{now, current.left, current.right});
            history_.prune(now);
        }
        return result;
    }

    BlinkResult BlinkDetector::observe(double left_open_prob, double right_open_prob)
    {
        return observe(left_open_prob, right_open_prob, Clock::now());
    }

    void BlinkDetector::prune(TimePoint now)
    {
        history_.prune(now);
    }

    int BlinkDetector::blinkRate(TimePoint now) const
    {
        return history_.countWithin(now, std::chrono::milliseconds(Constants::RATE_WINDOW_MS));
    }

    BlinkStats BlinkDetector::stats(TimePoint now) const
    {
        BlinkStats stats;
        stats.blink_rate = blinkRate(now);
        stats.total_blinks = totalBlinks();
        stats.left_eye_blinks = history_.leftEyeClosedCount();
        stats.right_eye_blinks = history_.rightEyeClosedCount();
        stats.average_blink_duration_ms = thresholds_.average_blink_duration_ms;
        stats.session_seconds = static_cast<long long>(getSessionDuration(now));
        return stats;
    }

    void BlinkDetector::reset(TimePoint now)
    {
        history_.clear();
        eye_state_ = EyeState{};
        session_start_ = now;
    }

    double BlinkDetector::getSessionDuration(TimePoint now) const
    {
        if (now < session_start_)
            return 0.0;
        return std::chrono::duration<double>(now - session_start_).count();
    }

    bool BlinkDetector::withinMinInterval(TimePoint now) const
    {
        if (thresholds_.min_blink_interval_ms <= 0)
            return false;

        std::optional<TimePoint> last = history_.lastTimestamp();
        if (!last)
            return false;
        return now - *last <= std::chrono::milliseconds(thresholds_.min_blink_interval_ms);
    }
}
