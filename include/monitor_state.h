#ifndef MONITOR_STATE_H
#define MONITOR_STATE_H

#include <string>

namespace BlinkMonitor
{
    enum class MonitorEvent
    {
        BLINK,
        LOW_BLINK_RATE,
        NO_FACE_DETECTED,
        SESSION_RESET
    };

    enum class BlinkRateStatus
    {
        LOW,
        SLIGHTLY_LOW,
        NORMAL,
        HIGH
    };

    BlinkRateStatus classifyBlinkRate(int blinks_per_minute);

    std::string eventToString(MonitorEvent event);
    std::string rateStatusToString(BlinkRateStatus status);
}

#endif // MONITOR_STATE_H
