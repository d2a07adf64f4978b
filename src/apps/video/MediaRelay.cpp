#include "apps/video/MediaRelay.hpp"

#include <iostream>

namespace video {

static inline MediaRelayConfig sanitise(const MediaRelayConfig& in) {
    MediaRelayConfig cfg = in;
    if (cfg.fps < 1)  cfg.fps = 1;
    if (cfg.fps > 60) cfg.fps = 60;
    if (cfg.idle_backoff_ms == 0) cfg.idle_backoff_ms = 500;
    if (cfg.log_every_failures == 0) cfg.log_every_failures = 1;
    return cfg;
}

MediaRelay::MediaRelay(const MediaRelayConfig& cfg,
                       const ctrl::ClientTargetRegistry& registry,
                       platform::ICameraSource& camera,
                       IFrameEncoder& encoder,
                       net::DatagramSink& sink)
: m_cfg(sanitise(cfg))
, m_registry(registry)
, m_camera(camera)
, m_encoder(encoder)
, m_sink(sink) {
    m_period_us = 1000000ull / m_cfg.fps;
}

void MediaRelay::TaskEntry(void* arg) {
    auto* ctx = static_cast<TaskCtx*>(arg);

    // Minimal defensive checks.
    if (!ctx || !ctx->self) {
        return;
    }
    ctx->self->Run();
}

void MediaRelay::RequestStop() {
    m_stop_requested.store(true);
    m_wake.give();
}

void MediaRelay::StopHook(void* arg) {
    auto* self = static_cast<MediaRelay*>(arg);
    if (self) self->RequestStop();
}

RelayStats MediaRelay::Stats() const {
    RelayStats s;
    s.frames_sent     = m_frames_sent.load();
    s.send_failures   = m_send_failures.load();
    s.encode_failures = m_encode_failures.load();
    s.grab_failures   = m_grab_failures.load();
    s.idle_waits      = m_idle_waits.load();
    return s;
}

void MediaRelay::Run() {
    if (StopRequested()) return;

    if (!m_camera.Open()) {
        std::cerr << "[RELAY] camera unavailable, media relay disabled\n";
        m_disabled.store(true);
        return;
    }

    m_running.store(true);
    std::cout << "[RELAY] started at " << m_cfg.fps << " fps\n";

    while (!StopRequested()) {
        msg::ClientTarget target{};
        if (!m_registry.Get(target)) {
            m_idle_waits.fetch_add(1);
            (void)m_wake.take_for(m_cfg.idle_backoff_ms);
            continue;
        }

        const uint64_t t0 = Rtos::NowUs();

        if (!m_camera.Grab(m_frame)) {
            const uint32_t n = m_grab_failures.fetch_add(1) + 1;
            if (n == 1 || n % m_cfg.log_every_failures == 0) {
                std::cerr << "[RELAY] frame grab failed (" << n << " total)\n";
            }
            pace(t0);
            continue;
        }

        if (!m_encoder.Encode(m_frame, m_payload)) {
            const uint32_t n = m_encode_failures.fetch_add(1) + 1;
            std::cerr << "[RELAY] encode failed, frame skipped (" << n << " total)\n";
            pace(t0);
            continue;
        }

        sendFrame(target);
        pace(t0);
    }

    m_camera.Release();
    m_running.store(false);

    const RelayStats s = Stats();
    std::cout << "[RELAY] stopped: sent=" << s.frames_sent
              << " send_fail=" << s.send_failures
              << " encode_fail=" << s.encode_failures
              << " grab_fail=" << s.grab_failures << "\n";
}

void MediaRelay::sendFrame(const msg::ClientTarget& target) {
    bool ok = false;
    if (m_payload.size() > net::UDP_MAX_PAYLOAD) {
        std::cerr << "[RELAY] frame of " << m_payload.size()
                  << " bytes exceeds one datagram, dropped\n";
    } else {
        ok = m_sink.SendTo(target, m_payload.data(), m_payload.size());
    }

    if (ok) {
        m_frames_sent.fetch_add(1);
        return;
    }

    // Best effort: the target stays registered, next iteration retries.
    const uint32_t n = m_send_failures.fetch_add(1) + 1;
    if (n == 1 || n % m_cfg.log_every_failures == 0) {
        std::cerr << "[RELAY] send to " << target.host << ":" << target.port
                  << " failed (" << n << " total)\n";
    }
}

void MediaRelay::pace(uint64_t t_start_us) {
    const uint64_t elapsed = Rtos::NowUs() - t_start_us;
    if (elapsed >= m_period_us) return;
    const uint32_t remain_ms = static_cast<uint32_t>((m_period_us - elapsed) / 1000ull);
    if (remain_ms > 0) {
        (void)m_wake.take_for(remain_ms);
    }
}

} // namespace video
