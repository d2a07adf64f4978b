#include "apps/station/MediaReceiver.hpp"

#include <cstdio>
#include <cstring>
#include <iostream>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace station {

MediaReceiver::MediaReceiver(const MediaReceiverConfig& cfg,
                             platform::IFrameDisplay* display,
                             core::ShutdownCoordinator* shutdown)
: m_cfg(cfg)
, m_display(display)
, m_shutdown(shutdown) {
    if (m_cfg.recv_timeout_ms == 0) m_cfg.recv_timeout_ms = 200;
    m_buf.resize(net::UDP_MAX_PAYLOAD);
}

bool MediaReceiver::Open() {
    if (!m_sock.Open() || !m_sock.Bind(m_cfg.port) || !m_sock.SetRecvTimeoutMs(m_cfg.recv_timeout_ms)) {
        std::cerr << "[VIDEO] cannot bind UDP port " << m_cfg.port
                  << " status=" << net::SocketStatusStr(m_sock.lastStatus())
                  << " errno=" << m_sock.lastErrno()
                  << " (" << std::strerror(m_sock.lastErrno()) << ")\n";
        m_sock.Close();
        return false;
    }
    std::cout << "[VIDEO] listening on UDP " << m_sock.BoundPort() << "\n";
    return true;
}

void MediaReceiver::TaskEntry(void* arg) {
    auto* ctx = static_cast<TaskCtx*>(arg);

    // Minimal defensive checks.
    if (!ctx || !ctx->self) {
        return;
    }
    ctx->self->Run(ctx->status_in);
}

void MediaReceiver::StopHook(void* arg) {
    auto* self = static_cast<MediaReceiver*>(arg);
    if (self) self->RequestStop();
}

bool MediaReceiver::DecodeFrame(const uint8_t* data, std::size_t len, cv::Mat& out) {
    if (!data || len == 0) return false;
    try {
        const cv::Mat raw(1, static_cast<int>(len), CV_8UC1, const_cast<uint8_t*>(data));
        out = cv::imdecode(raw, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        std::cerr << "[VIDEO] imdecode threw: " << e.what() << "\n";
        out.release();
        return false;
    }
    return !out.empty();
}

void MediaReceiver::DrawOverlay(cv::Mat& frame, const msg::StatusReport& s) {
    if (frame.empty()) return;
    char line[96];
    std::snprintf(line, sizeof(line), "bat %d%%  spd %.2f  str %+.2f",
                  s.battery, static_cast<double>(s.speed), static_cast<double>(s.steering));
    cv::putText(frame, line, cv::Point(6, 18), cv::FONT_HERSHEY_SIMPLEX, 0.45,
                cv::Scalar(0, 0, 0), 3, cv::LINE_AA);
    cv::putText(frame, line, cv::Point(6, 18), cv::FONT_HERSHEY_SIMPLEX, 0.45,
                cv::Scalar(0, 255, 0), 1, cv::LINE_AA);
}

void MediaReceiver::Run(StatusQueue* status_in) {
    if (!m_sock.IsOpen()) {
        std::cerr << "[VIDEO] receiver started without a bound socket\n";
        return;
    }

    bool show = m_display && m_display->Open();
    if (!show) {
        std::cout << "[VIDEO] no display, frames are decoded but not shown\n";
    }

    msg::StatusReport last_status{};
    bool have_status = false;
    cv::Mat frame;

    while (!StopRequested()) {
        std::size_t n = 0;
        if (!m_sock.RecvFrom(m_buf.data(), m_buf.size(), n)) {
            if (m_sock.lastStatus() != net::SocketStatus::TIMEOUT) {
                std::cerr << "[VIDEO] recv failed status=" << net::SocketStatusStr(m_sock.lastStatus())
                          << " errno=" << m_sock.lastErrno() << "\n";
                Rtos::SleepMs(50);
            }
            if (show) {
                m_display->PollEvents();
                if (m_display->QuitRequested()) {
                    if (m_shutdown) m_shutdown->RequestShutdown("display closed");
                    break;
                }
            }
            continue;
        }

        if (!DecodeFrame(m_buf.data(), n, frame)) {
            const uint32_t d = m_dropped.fetch_add(1) + 1;
            if (d == 1 || d % 100 == 0) {
                std::cerr << "[VIDEO] undecodable datagram of " << n << " bytes dropped ("
                          << d << " total)\n";
            }
            continue;
        }
        m_decoded.fetch_add(1);

        if (status_in) {
            msg::StatusReport r{};
            if (status_in->try_receive(r)) {
                last_status = r;
                have_status = true;
            }
        }

        if (show) {
            if (m_cfg.overlay_status && have_status) DrawOverlay(frame, last_status);
            m_display->Show(frame);
            if (m_display->QuitRequested()) {
                if (m_shutdown) m_shutdown->RequestShutdown("display closed");
                break;
            }
        }
    }

    if (show) m_display->Close();
    m_sock.Close();
    std::cout << "[VIDEO] exiting, decoded=" << m_decoded.load()
              << " dropped=" << m_dropped.load() << "\n";
}

} // namespace station
