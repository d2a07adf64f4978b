#include "apps/station/CommandSender.hpp"
#include "apps/ctrl/MotionValidator.hpp"

#include <cmath>
#include <cstring>
#include <iostream>

namespace {

float dead_zone(float v, float dz) {
    if (std::isnan(v)) return 0.0f;
    if (std::fabs(v) < dz) return 0.0f;
    if (v > 1.0f)  return 1.0f;
    if (v < -1.0f) return -1.0f;
    return v;
}

} // anonymous namespace

namespace station {

// =======================
// CommandFilter
// =======================

CommandFilter::CommandFilter(const CommandFilterConfig& cfg)
: m_cfg(cfg) {
    if (m_cfg.dead_zone < 0.0f) m_cfg.dead_zone = 0.0f;
    if (m_cfg.dead_zone > 0.9f) m_cfg.dead_zone = 0.9f;
    if (m_cfg.min_delta < 0.0f) m_cfg.min_delta = 0.0f;
    if (m_cfg.resend_ms == 0)   m_cfg.resend_ms = 50;
}

msg::MotionCommand CommandFilter::Map(const platform::InputSample& in) const {
    const float t = dead_zone(in.throttle, m_cfg.dead_zone);
    const float s = dead_zone(in.steering, m_cfg.dead_zone);

    msg::MotionCommand c{};
    if (t > 0.0f) {
        c.direction = msg::Direction::FORWARD;
        c.speed = t;
    } else if (t < 0.0f) {
        c.direction = msg::Direction::BACKWARD;
        c.speed = -t;
    } else if (s != 0.0f) {
        c.direction = msg::Direction::FORWARD;
        c.speed = 0.0f;
    } else {
        return msg::MotionCommand::Zero();
    }
    c.steering = s;
    return c;
}

bool CommandFilter::ShouldSend(const msg::MotionCommand& cmd, uint64_t now_us) const {
    if (!m_have_last) return true;
    if (cmd.direction != m_last.direction) return true;
    if (std::fabs(cmd.speed - m_last.speed) > m_cfg.min_delta) return true;
    if (std::fabs(cmd.steering - m_last.steering) > m_cfg.min_delta) return true;
    return (now_us - m_last_us) >= uint64_t(m_cfg.resend_ms) * 1000ull;
}

void CommandFilter::MarkSent(const msg::MotionCommand& cmd, uint64_t now_us) {
    m_have_last = true;
    m_last      = cmd;
    m_last_us   = now_us;
}

msg::Message CommandFilter::ToMessage(const msg::MotionCommand& cmd) {
    if (cmd.direction == msg::Direction::STOP) {
        return msg::MakeMessage(msg::CmdType::STOP);
    }
    return ctrl::MotionValidator::ToMessage(cmd);
}

// =======================
// CommandSender
// =======================

CommandSender::CommandSender(const CommandSenderConfig& cfg,
                             OperatorLink& link,
                             platform::IInputSource* input,
                             core::ShutdownCoordinator* shutdown)
: m_cfg(cfg)
, m_link(link)
, m_input(input)
, m_shutdown(shutdown)
, m_filter(cfg.filter) {
    if (m_cfg.poll_ms == 0) m_cfg.poll_ms = 10;
}

void CommandSender::TaskEntry(void* arg) {
    auto* ctx = static_cast<TaskCtx*>(arg);

    // Minimal defensive checks.
    if (!ctx || !ctx->self) {
        return;
    }
    ctx->self->Run();
}

void CommandSender::RequestStop() {
    m_stop_requested.store(true);
    m_wake.give();
}

void CommandSender::StopHook(void* arg) {
    auto* self = static_cast<CommandSender*>(arg);
    if (self) self->RequestStop();
}

bool CommandSender::send(const msg::Message& m) {
    net::SocketStatus st = net::SocketStatus::OK;
    int err = 0;
    if (m_link.SendMessage(m, &st, &err)) return true;

    m_last_fault = st;
    std::cerr << "[SENDER] write failed status=" << net::SocketStatusStr(st)
              << " errno=" << err
              << " (" << std::strerror(err) << ")\n";
    if (m_shutdown) m_shutdown->RequestShutdown("command link lost");
    return false;
}

void CommandSender::Run() {
    uint64_t last_status_us = Rtos::NowUs();
    bool link_ok = true;

    std::cout << "[SENDER] started, input=" << (m_input ? m_input->Name() : "none")
              << " status every " << m_cfg.status_ms << " ms\n";

    while (!StopRequested() && link_ok) {
        const uint64_t now = Rtos::NowUs();

        if (m_input) {
            platform::InputSample sample{};
            if (!m_input->Poll(sample)) {
                std::cerr << "[SENDER] input " << m_input->Name()
                          << " lost, holding neutral\n";
                m_input = nullptr;
                sample = platform::InputSample{};
            }

            if (sample.quit) {
                if (m_shutdown) m_shutdown->RequestShutdown("operator quit");
                break;
            }

            const msg::MotionCommand cmd = m_filter.Map(sample);
            if (m_filter.ShouldSend(cmd, now)) {
                if (!send(CommandFilter::ToMessage(cmd))) {
                    link_ok = false;
                    break;
                }
                m_filter.MarkSent(cmd, now);
                m_moves_sent.fetch_add(1);
            }
        }

        if (m_cfg.status_ms > 0 && (now - last_status_us) >= uint64_t(m_cfg.status_ms) * 1000ull) {
            if (!send(msg::MakeMessage(msg::CmdType::STATUS))) {
                link_ok = false;
                break;
            }
            last_status_us = now;
            m_status_sent.fetch_add(1);
        }

        (void)m_wake.take_for(m_cfg.poll_ms);
    }

    // Leave the vehicle stationary whatever ended the loop.
    if (link_ok && m_link.SendMessage(msg::MakeMessage(msg::CmdType::STOP))) {
        std::cout << "[SENDER] stop sent\n";
    }
    std::cout << "[SENDER] exiting, moves=" << m_moves_sent.load()
              << " status=" << m_status_sent.load() << "\n";
}

} // namespace station
