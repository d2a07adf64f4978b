#include "platform/linux/OpenCvCamera.hpp"

#include <iostream>

namespace platform {

OpenCvCamera::OpenCvCamera(const OpenCvCameraConfig& cfg)
: m_cfg(cfg) {
    if (m_cfg.index < 0) m_cfg.index = 0;
}

OpenCvCamera::~OpenCvCamera() {
    Release();
}

bool OpenCvCamera::Open() {
    try {
        if (!m_cap.open(m_cfg.index, cv::CAP_V4L2)) {
            // Some UVC drivers only come up through the default backend.
            if (!m_cap.open(m_cfg.index)) {
                std::cerr << "[CAMERA] cannot open camera index " << m_cfg.index << "\n";
                return false;
            }
        }
        if (m_cfg.width > 0)  m_cap.set(cv::CAP_PROP_FRAME_WIDTH,  m_cfg.width);
        if (m_cfg.height > 0) m_cap.set(cv::CAP_PROP_FRAME_HEIGHT, m_cfg.height);
    } catch (const cv::Exception& e) {
        std::cerr << "[CAMERA] open failed: " << e.what() << "\n";
        m_cap.release();
        return false;
    }

    std::cout << "[CAMERA] opened index " << m_cfg.index << " "
              << m_cap.get(cv::CAP_PROP_FRAME_WIDTH) << "x"
              << m_cap.get(cv::CAP_PROP_FRAME_HEIGHT) << "\n";
    return true;
}

bool OpenCvCamera::Grab(cv::Mat& out) {
    if (!m_cap.isOpened()) return false;
    try {
        if (!m_cap.read(out)) return false;
    } catch (const cv::Exception& e) {
        std::cerr << "[CAMERA] read failed: " << e.what() << "\n";
        return false;
    }
    return !out.empty();
}

void OpenCvCamera::Release() {
    if (m_cap.isOpened()) {
        m_cap.release();
        std::cout << "[CAMERA] released\n";
    }
}

} // namespace platform
