#pragma once
#include <cstdint>
#include <vector>

#include <opencv2/core.hpp>

namespace video {

// Turns one captured frame into one datagram payload.
class IFrameEncoder {
public:
    virtual ~IFrameEncoder() = default;
    virtual bool Encode(const cv::Mat& frame, std::vector<uint8_t>& out) = 0;
};

struct JpegEncoderConfig {
    int width   = 320;
    int height  = 240;
    int quality = 50;   // 1..100
};

// Resize to a fixed size, then baseline JPEG.
class JpegEncoder : public IFrameEncoder {
public:
    explicit JpegEncoder(const JpegEncoderConfig& cfg = {});

    bool Encode(const cv::Mat& frame, std::vector<uint8_t>& out) override;

private:
    JpegEncoderConfig m_cfg{};
    cv::Mat m_scaled;   // reused between frames
};

} // namespace video
