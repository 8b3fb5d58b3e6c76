#ifndef EYE_STATE_H
#define EYE_STATE_H

namespace BlinkMonitor
{
    // true = open
    struct EyeState
    {
        bool left = true;
        bool right = true;
    };

    struct BlinkResult
    {
        bool left_blink = false;
        bool right_blink = false;
        bool any_blink = false;
    };

    // An eye counts as open only strictly above the closure threshold
    EyeState classifyEyes(double left_open_prob, double right_open_prob, double eye_closure_threshold);

    // Open-to-closed transitions between two consecutive classifications
    BlinkResult detectFallingEdges(const EyeState &previous, const EyeState &current);
}

#endif // EYE_STATE_H
