#pragma once
#include <opencv2/core.hpp>

namespace platform {

// Frame source for the media relay. Only the relay task calls it.
class ICameraSource {
public:
    virtual ~ICameraSource() = default;

    // False when the device is absent or busy.
    virtual bool Open() = 0;

    // One BGR frame. False on a failed grab; the caller skips the iteration.
    virtual bool Grab(cv::Mat& out) = 0;

    virtual void Release() = 0;
    virtual bool IsOpen() const = 0;
};

} // namespace platform
