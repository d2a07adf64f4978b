#pragma once
#include <atomic>
#include <cstdint>
#include <vector>

#include "os/rtos.hpp"
#include "net/UdpSocket.hpp"
#include "apps/ctrl/ClientTargetRegistry.hpp"
#include "apps/video/FrameEncoder.hpp"
#include "platform/ICameraSource.hpp"

namespace video {

// ------------------------------
// Config
// ------------------------------
struct MediaRelayConfig {
    uint32_t fps = 20;                 // 1..60
    uint32_t idle_backoff_ms = 500;    // no target registered
    uint32_t log_every_failures = 100; // rate-limit repeated send/grab errors
};

struct RelayStats {
    uint32_t frames_sent     = 0;
    uint32_t send_failures   = 0;
    uint32_t encode_failures = 0;
    uint32_t grab_failures   = 0;
    uint32_t idle_waits      = 0;
};

// ---------------------------------------------------------------------------
// MediaRelay: camera -> encoder -> one datagram to the registered target.
//
// Long-lived task. Every per-frame failure costs that iteration only; the
// loop ends solely on RequestStop(). All waits (idle backoff, frame pacing)
// are on a semaphore RequestStop() gives, so stop latency is one iteration.
// Only the relay task touches the camera; it opens it on entry and releases
// it before returning.
// ---------------------------------------------------------------------------
class MediaRelay {
public:
    // Task entry wiring for OSAL (void* arg).
    // NOTE: The TaskCtx object must outlive the task.
    struct TaskCtx {
        MediaRelay* self = nullptr;
    };

public:
    MediaRelay(const MediaRelayConfig& cfg,
               const ctrl::ClientTargetRegistry& registry,
               platform::ICameraSource& camera,
               IFrameEncoder& encoder,
               net::DatagramSink& sink);

    // OSAL-compatible entry point
    static void TaskEntry(void* arg);

    // Thread-safe.
    void RequestStop();
    bool StopRequested() const { return m_stop_requested.load(); }

    // Stop hook signature for core::ShutdownCoordinator.
    static void StopHook(void* arg);

    bool Running()  const { return m_running.load(); }
    bool Disabled() const { return m_disabled.load(); }   // camera was unavailable

    RelayStats Stats() const;

private:
    void Run();
    void sendFrame(const msg::ClientTarget& target);
    void pace(uint64_t t_start_us);

private:
    MediaRelayConfig                 m_cfg{};
    const ctrl::ClientTargetRegistry& m_registry;
    platform::ICameraSource&         m_camera;
    IFrameEncoder&                   m_encoder;
    net::DatagramSink&               m_sink;

    uint64_t m_period_us = 0;

    std::atomic<bool> m_stop_requested{false};
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_disabled{false};
    Rtos::BinarySemaphore m_wake;

    // Relay task only
    cv::Mat              m_frame;
    std::vector<uint8_t> m_payload;

    std::atomic<uint32_t> m_frames_sent{0};
    std::atomic<uint32_t> m_send_failures{0};
    std::atomic<uint32_t> m_encode_failures{0};
    std::atomic<uint32_t> m_grab_failures{0};
    std::atomic<uint32_t> m_idle_waits{0};
};

} // namespace video
