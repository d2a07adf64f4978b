#include "platform/linux/OpenCvDisplay.hpp"

#include <cstdlib>
#include <iostream>

#include <opencv2/highgui.hpp>

namespace platform {

OpenCvDisplay::OpenCvDisplay(const std::string& title)
: m_title(title) {}

OpenCvDisplay::~OpenCvDisplay() {
    Close();
}

bool OpenCvDisplay::Open() {
    const char* x11 = std::getenv("DISPLAY");
    const char* wl  = std::getenv("WAYLAND_DISPLAY");
    if ((!x11 || !*x11) && (!wl || !*wl)) {
        std::cout << "[DISPLAY] no display session, frames will not be rendered\n";
        return false;
    }

    try {
        cv::namedWindow(m_title, cv::WINDOW_AUTOSIZE);
    } catch (const cv::Exception& e) {
        std::cerr << "[DISPLAY] namedWindow failed: " << e.what() << "\n";
        return false;
    }
    m_open = true;
    return true;
}

void OpenCvDisplay::Show(const cv::Mat& frame) {
    if (!m_open || frame.empty()) return;
    try {
        cv::imshow(m_title, frame);
        pumpKeys();
    } catch (const cv::Exception& e) {
        std::cerr << "[DISPLAY] imshow failed: " << e.what() << "\n";
        m_open = false;
    }
}

void OpenCvDisplay::PollEvents() {
    if (!m_open) return;
    try {
        pumpKeys();
    } catch (const cv::Exception& e) {
        std::cerr << "[DISPLAY] event poll failed: " << e.what() << "\n";
        m_open = false;
    }
}

void OpenCvDisplay::pumpKeys() {
    const int key = cv::waitKey(1) & 0xFF;
    if (key == 'q' || key == 27) m_quit.store(true);
    if (cv::getWindowProperty(m_title, cv::WND_PROP_VISIBLE) < 1.0) m_quit.store(true);
}

void OpenCvDisplay::Close() {
    if (!m_open) return;
    try {
        cv::destroyWindow(m_title);
    } catch (const cv::Exception& e) {
        std::cerr << "[DISPLAY] destroyWindow failed: " << e.what() << "\n";
    }
    m_open = false;
}

} // namespace platform
