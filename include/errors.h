#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

namespace BlinkMonitor
{
    // Detection requested before the landmark detector finished loading
    class NotInitializedError : public std::runtime_error
    {
    public:
        explicit NotInitializedError(const std::string &what)
            : std::runtime_error(what) {}
    };

    // A raw detection without the six expected keypoints
    class MalformedDetectionError : public std::runtime_error
    {
    public:
        MalformedDetectionError(const std::string &what, size_t keypoint_count)
            : std::runtime_error(what), keypoint_count_(keypoint_count) {}

        size_t keypointCount() const { return keypoint_count_; }

    private:
        size_t keypoint_count_;
    };
}

#endif // ERRORS_H
