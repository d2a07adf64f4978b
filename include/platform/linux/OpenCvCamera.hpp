#pragma once
#include <opencv2/videoio.hpp>

#include "platform/ICameraSource.hpp"

namespace platform {

struct OpenCvCameraConfig {
    int index = 0;         // /dev/video<index>
    int width  = 640;      // requested; the relay resizes anyway
    int height = 480;
};

// cv::VideoCapture on a V4L2 index.
class OpenCvCamera : public ICameraSource {
public:
    explicit OpenCvCamera(const OpenCvCameraConfig& cfg = {});
    ~OpenCvCamera() override;

    bool Open() override;
    bool Grab(cv::Mat& out) override;
    void Release() override;
    bool IsOpen() const override { return m_cap.isOpened(); }

private:
    OpenCvCameraConfig m_cfg{};
    cv::VideoCapture   m_cap;
};

} // namespace platform
