#ifndef CONSTANTS_H
#define CONSTANTS_H

namespace BlinkMonitor
{
    namespace Constants
    {
        constexpr int ESC_KEY = 27;
        constexpr int RESET_KEY = 'r';
        constexpr int WAIT_KEY_MS = 3;
        constexpr int MAX_LOG_ENTRIES = 1000;

        // Added to the eye-to-ear span before dividing
        constexpr double OPENNESS_EPSILON = 0.1;
        constexpr float DEFAULT_DETECTION_PROBABILITY = 0.9f;

        // blinkRate() always counts over one minute, whatever the retention window
        constexpr long long RATE_WINDOW_MS = 60000;
    }

    namespace KeypointIndices
    {
        constexpr int RIGHT_EYE = 0;
        constexpr int LEFT_EYE = 1;
        constexpr int NOSE_TIP = 2;
        constexpr int MOUTH_CENTER = 3;
        constexpr int RIGHT_EAR_TRAGION = 4;
        constexpr int LEFT_EAR_TRAGION = 5;
        constexpr int KEYPOINT_COUNT = 6;
    }

    // dlib 68-point layout, reduced to the six keypoints above
    namespace LandmarkIndices
    {
        constexpr int FACE_LANDMARK_COUNT = 68;
        constexpr int RIGHT_EYE_START = 36, RIGHT_EYE_END = 41;
        constexpr int LEFT_EYE_START = 42, LEFT_EYE_END = 47;
        constexpr int NOSE_TIP = 30;
        constexpr int MOUTH_START = 60, MOUTH_END = 67;
        constexpr int RIGHT_JAW_TOP = 1;
        constexpr int LEFT_JAW_TOP = 15;
    }

    namespace BlinkRateBands
    {
        constexpr int LOW_BELOW = 8;
        constexpr int NORMAL_MIN = 12;
        constexpr int NORMAL_MAX = 25;
    }
}

#endif // CONSTANTS_H
