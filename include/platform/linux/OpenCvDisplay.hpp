#pragma once
#include <atomic>
#include <string>

#include "platform/IFrameDisplay.hpp"

namespace platform {

// highgui window. Needs an X/Wayland session ($DISPLAY or $WAYLAND_DISPLAY).
class OpenCvDisplay : public IFrameDisplay {
public:
    explicit OpenCvDisplay(const std::string& title = "RoverLink");
    ~OpenCvDisplay() override;

    bool Open() override;
    void Show(const cv::Mat& frame) override;
    void PollEvents() override;
    bool QuitRequested() const override { return m_quit.load(); }
    void Close() override;

private:
    void pumpKeys();

    std::string m_title;
    bool m_open = false;
    std::atomic<bool> m_quit{false};
};

} // namespace platform
