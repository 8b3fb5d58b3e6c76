#ifndef CV_UTILS_H
#define CV_UTILS_H

#include <string>
#include <opencv2/opencv.hpp>
#include "monitor_state.h"
#include "config.h"

namespace BlinkMonitor
{
    namespace CVUtils
    {
        cv::Scalar getStatusColor(BlinkRateStatus status, const Config &config);
        std::string formatDouble(double value, int precision = 3);
        // mm:ss, minutes keep growing past 59
        std::string formatSessionTime(long long seconds);
    }
}

#endif // CV_UTILS_H
