#pragma once
#include <opencv2/core.hpp>

namespace platform {

// Renders decoded media frames on the operator station.
class IFrameDisplay {
public:
    virtual ~IFrameDisplay() = default;

    // False when there is nowhere to draw (headless session).
    virtual bool Open() = 0;

    virtual void Show(const cv::Mat& frame) = 0;

    // Handles window events when no frame arrived, so the quit key still
    // works while the feed is stalled.
    virtual void PollEvents() = 0;

    // Set once the operator closed the window or pressed q / Esc in it.
    virtual bool QuitRequested() const = 0;

    virtual void Close() = 0;
};

} // namespace platform
