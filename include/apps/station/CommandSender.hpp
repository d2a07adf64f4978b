#pragma once
#include <atomic>
#include <cstdint>

#include "os/rtos.hpp"
#include "msg/Message.hpp"
#include "msg/MotionCommand.hpp"
#include "apps/core/ShutdownCoordinator.hpp"
#include "apps/station/OperatorLink.hpp"
#include "platform/IInputSource.hpp"

namespace station {

// ------------------------------
// Input -> MotionCommand, and when to put it on the wire.
// ------------------------------
struct CommandFilterConfig {
    float    dead_zone  = 0.10f;   // |axis| below this reads as 0
    float    min_delta  = 0.05f;   // speed/steering change that forces a send
    uint32_t resend_ms  = 50;      // otherwise resend at least this often
};

class CommandFilter {
public:
    explicit CommandFilter(const CommandFilterConfig& cfg = {});

    // throttle > 0 forward, < 0 backward; steering alone keeps FORWARD at
    // speed 0 so the wheels can turn in place; both neutral -> STOP.
    msg::MotionCommand Map(const platform::InputSample& in) const;

    // True when 'cmd' differs enough from the last sent command, the
    // direction changed, nothing was sent yet, or resend_ms has elapsed.
    bool ShouldSend(const msg::MotionCommand& cmd, uint64_t now_us) const;

    void MarkSent(const msg::MotionCommand& cmd, uint64_t now_us);

    // STOP -> "stop", anything else -> "move".
    static msg::Message ToMessage(const msg::MotionCommand& cmd);

private:
    CommandFilterConfig m_cfg{};
    bool               m_have_last = false;
    msg::MotionCommand m_last{};
    uint64_t           m_last_us = 0;
};

// ------------------------------
// Config
// ------------------------------
struct CommandSenderConfig {
    uint32_t poll_ms   = 10;
    uint32_t status_ms = 1000;   // 0 = never request status
    CommandFilterConfig filter{};
};

// ---------------------------------------------------------------------------
// CommandSender: polls the input device and writes move/stop/status frames
// through the link's write gate. Sends one final stop when it exits.
// ---------------------------------------------------------------------------
class CommandSender {
public:
    // Task entry wiring for OSAL (void* arg).
    // NOTE: The TaskCtx object must outlive the task.
    struct TaskCtx {
        CommandSender* self = nullptr;
    };

public:
    // 'input' may be null (no local control, status polling only).
    CommandSender(const CommandSenderConfig& cfg,
                  OperatorLink& link,
                  platform::IInputSource* input,
                  core::ShutdownCoordinator* shutdown);

    static void TaskEntry(void* arg);

    void RequestStop();
    bool StopRequested() const { return m_stop_requested.load(); }

    static void StopHook(void* arg);

    uint32_t MovesSent()  const { return m_moves_sent.load(); }
    uint32_t StatusSent() const { return m_status_sent.load(); }

    // Write fault that ended the loop, OK if none. Read after the task joined.
    net::SocketStatus LastFault() const { return m_last_fault; }

private:
    void Run();
    bool send(const msg::Message& m);

private:
    CommandSenderConfig        m_cfg{};
    OperatorLink&              m_link;
    platform::IInputSource*    m_input = nullptr;
    core::ShutdownCoordinator* m_shutdown = nullptr;

    CommandFilter m_filter;

    std::atomic<bool>     m_stop_requested{false};
    Rtos::BinarySemaphore m_wake;

    std::atomic<uint32_t> m_moves_sent{0};
    std::atomic<uint32_t> m_status_sent{0};

    net::SocketStatus m_last_fault = net::SocketStatus::OK;
};

} // namespace station
