#ifndef BLINK_DETECTOR_H
#define BLINK_DETECTOR_H

#include "config.h"
#include "eye_state.h"
#include "blink_history.h"

namespace BlinkMonitor
{
    struct BlinkStats
    {
        int blink_rate = 0; // blinks in the last minute
        int total_blinks = 0;
        int left_eye_blinks = 0;
        int right_eye_blinks = 0;
        double average_blink_duration_ms = 0.0; // configured constant, durations are not measured
        long long session_seconds = 0;
    };

    /**
     * @brief Edge-triggered blink detection over per-eye openness probabilities
     *
     * One instance per monitoring session. Not thread safe: observe() must be
     * driven from a single frame loop.
     */
    class BlinkDetector
    {
    private:
        const Thresholds thresholds_;
        EyeState eye_state_;
        BlinkHistory history_;
        TimePoint session_start_;

        bool withinMinInterval(TimePoint now) const;

    public:
        explicit BlinkDetector(const Thresholds &thresholds, TimePoint session_start = Clock::now());

        // Classifies both eyes, records a blink on any falling edge and
        // always moves the tracked state to the new classification.
        BlinkResult observe(double left_open_prob, double right_open_prob, TimePoint now);
        BlinkResult observe(double left_open_prob, double right_open_prob);

        void prune(TimePoint now);

        int blinkRate(TimePoint now) const;
        int blinkRate() const { return blinkRate(Clock::now()); }
        int totalBlinks() const { return history_.size(); }

        BlinkStats stats(TimePoint now) const;
        BlinkStats stats() const { return stats(Clock::now()); }

        void reset(TimePoint now);
        void reset() { reset(Clock::now()); }

        const EyeState &getEyeState() const { return eye_state_; }
        const BlinkHistory &getHistory() const { return history_; }
        const Thresholds &getThresholds() const { return thresholds_; }
        double getSessionDuration(TimePoint now) const;
    };
}

#endif // BLINK_DETECTOR_H
