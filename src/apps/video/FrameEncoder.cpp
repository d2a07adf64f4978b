#include "apps/video/FrameEncoder.hpp"

#include <iostream>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace video {

static inline JpegEncoderConfig sanitise(const JpegEncoderConfig& in) {
    JpegEncoderConfig cfg = in;
    if (cfg.width <= 0)  cfg.width  = 320;
    if (cfg.height <= 0) cfg.height = 240;
    if (cfg.quality < 1)   cfg.quality = 1;
    if (cfg.quality > 100) cfg.quality = 100;
    return cfg;
}

JpegEncoder::JpegEncoder(const JpegEncoderConfig& cfg)
: m_cfg(sanitise(cfg)) {}

bool JpegEncoder::Encode(const cv::Mat& frame, std::vector<uint8_t>& out) {
    out.clear();
    if (frame.empty()) return false;

    try {
        const cv::Size target(m_cfg.width, m_cfg.height);
        const cv::Mat* src = &frame;
        if (frame.size() != target) {
            cv::resize(frame, m_scaled, target, 0, 0, cv::INTER_AREA);
            src = &m_scaled;
        }
        const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, m_cfg.quality};
        if (!cv::imencode(".jpg", *src, out, params)) {
            out.clear();
            return false;
        }
    } catch (const cv::Exception& e) {
        std::cerr << "[RELAY] encode failed: " << e.what() << "\n";
        out.clear();
        return false;
    }
    return !out.empty();
}

} // namespace video
