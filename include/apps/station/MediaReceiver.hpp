#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <opencv2/core.hpp>

#include "os/rtos.hpp"
#include "net/UdpSocket.hpp"
#include "msg/VehicleState.hpp"
#include "apps/core/ShutdownCoordinator.hpp"
#include "apps/station/StatusReceiver.hpp"
#include "platform/IFrameDisplay.hpp"

namespace station {

// ------------------------------
// Config
// ------------------------------
struct MediaReceiverConfig {
    uint16_t port = 6000;              // 0 = ephemeral (tests)
    uint32_t recv_timeout_ms = 200;    // bounds stop latency
    bool     overlay_status = true;
};

// ---------------------------------------------------------------------------
// MediaReceiver: one datagram = one JPEG. Undecodable datagrams are counted
// and dropped. The display is opened and driven from this task only.
// ---------------------------------------------------------------------------
class MediaReceiver {
public:
    // Task entry wiring for OSAL (void* arg).
    // NOTE: The TaskCtx object must outlive the task.
    struct TaskCtx {
        MediaReceiver* self = nullptr;
        StatusQueue*   status_in = nullptr;   // optional overlay source
    };

public:
    // 'display' may be null (headless: decode and count only).
    MediaReceiver(const MediaReceiverConfig& cfg,
                  platform::IFrameDisplay* display,
                  core::ShutdownCoordinator* shutdown);

    // Binds the UDP port. Call before starting the task.
    bool Open();
    uint16_t BoundPort() const { return m_sock.BoundPort(); }

    static void TaskEntry(void* arg);

    void RequestStop() { m_stop_requested.store(true); }
    bool StopRequested() const { return m_stop_requested.load(); }

    static void StopHook(void* arg);

    // False for anything cv::imdecode cannot turn into an image.
    static bool DecodeFrame(const uint8_t* data, std::size_t len, cv::Mat& out);

    // Draws battery / speed / steering in the top-left corner.
    static void DrawOverlay(cv::Mat& frame, const msg::StatusReport& s);

    uint32_t FramesDecoded() const { return m_decoded.load(); }
    uint32_t FramesDropped() const { return m_dropped.load(); }

private:
    void Run(StatusQueue* status_in);

private:
    MediaReceiverConfig        m_cfg{};
    platform::IFrameDisplay*   m_display = nullptr;
    core::ShutdownCoordinator* m_shutdown = nullptr;

    net::UdpSocket m_sock;
    std::vector<uint8_t> m_buf;

    std::atomic<bool>     m_stop_requested{false};
    std::atomic<uint32_t> m_decoded{0};
    std::atomic<uint32_t> m_dropped{0};
};

} // namespace station
