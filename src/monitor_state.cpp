#include "../include/monitor_state.h"
#include "../include/constants.h"

namespace BlinkMonitor
{
    BlinkRateStatus classifyBlinkRate(int blinks_per_minute)
    {
        if (blinks_per_minute >= BlinkRateBands::NORMAL_MIN && blinks_per_minute <= BlinkRateBands::NORMAL_MAX)
        {
            return BlinkRateStatus::NORMAL;
        }
        else if (blinks_per_minute < BlinkRateBands::LOW_BELOW)
        {
            return BlinkRateStatus::LOW;
        }
        else if (blinks_per_minute < BlinkRateBands::NORMAL_MIN)
        {
            return BlinkRateStatus::SLIGHTLY_LOW;
        }
        else
        {
            return BlinkRateStatus::HIGH;
        }
    }

    std::string eventToString(MonitorEvent event)
    {
        switch (event)
        {
        case MonitorEvent::BLINK:
            return "BLINK";
        case MonitorEvent::LOW_BLINK_RATE:
            return "LOW_BLINK_RATE";
        case MonitorEvent::NO_FACE_DETECTED:
            return "NO_FACE_DETECTED";
        case MonitorEvent::SESSION_RESET:
            return "SESSION_RESET";
        default:
            return "UNKNOWN";
        }
    }

    std::string rateStatusToString(BlinkRateStatus status)
    {
        switch (status)
        {
        case BlinkRateStatus::LOW:
            return "Low";
        case BlinkRateStatus::SLIGHTLY_LOW:
            return "Slightly Low";
        case BlinkRateStatus::NORMAL:
            return "Normal";
        case BlinkRateStatus::HIGH:
            return "High";
        default:
            return "Unknown";
        }
    }
}
