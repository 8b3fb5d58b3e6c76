#include "../include/cv_utils.h"
#include <sstream>
#include <iomanip>

namespace BlinkMonitor
{
    namespace CVUtils
    {
        cv::Scalar getStatusColor(BlinkRateStatus status, const Config &config)
        {
            switch (status)
            {
            case BlinkRateStatus::NORMAL:
                return config.normal_color;
            case BlinkRateStatus::SLIGHTLY_LOW:
            case BlinkRateStatus::HIGH:
                return config.warning_color;
            case BlinkRateStatus::LOW:
                return config.danger_color;
            default:
                return cv::Scalar(128, 128, 128); // Gray for unknown states
            }
        }

        std::string formatDouble(double value, int precision)
        {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(precision) << value;
            return oss.str();
        }

        std::string formatSessionTime(long long seconds)
        {
            if (seconds < 0)
                seconds = 0;
            std::ostringstream oss;
            oss << std::setw(2) << std::setfill('0') << seconds / 60
                << ":" << std::setw(2) << std::setfill('0') << seconds % 60;
            return oss.str();
        }
    }
}
