#include "../include/eye_state.h"

namespace BlinkMonitor
{
    EyeState classifyEyes(double left_open_prob, double right_open_prob, double eye_closure_threshold)
    {
        EyeState state;
        state.left = left_open_prob > eye_closure_threshold;
        state.right = right_open_prob > eye_closure_threshold;
        return state;
    }

    BlinkResult detectFallingEdges(const EyeState &previous, const EyeState &current)
    {
        BlinkResult result;
        result.left_blink = previous.left && !current.left;
        result.right_blink = previous.right && !current.right;
        result.any_blink = result.left_blink || result.right_blink;
        return result;
    }
}
