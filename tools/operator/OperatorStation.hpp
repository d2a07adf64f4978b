#pragma once
#include <memory>

#include "os/rtos.hpp"
#include "apps/core/Config.hpp"
#include "apps/core/ShutdownCoordinator.hpp"
#include "apps/station/CommandSender.hpp"
#include "apps/station/MediaReceiver.hpp"
#include "apps/station/OperatorLink.hpp"
#include "apps/station/StatusReceiver.hpp"
#include "platform/IFrameDisplay.hpp"
#include "platform/IInputSource.hpp"

namespace station {

// -------------------- Operator station --------------------
// Wires the operator side together:
// - one TCP link to the vehicle (register_video on connect)
// - CommandSender  : input -> move/stop/status
// - StatusReceiver : status_report -> log + overlay queue
// - MediaReceiver  : UDP JPEG -> display
//
// Teardown order: sender (sends stop) -> optional quit -> link shutdown ->
// bounded join of the rest.
class OperatorStation {
public:
    explicit OperatorStation(const core::OperatorConfig& cfg);
    ~OperatorStation();

    OperatorStation(const OperatorStation&) = delete;
    OperatorStation& operator=(const OperatorStation&) = delete;

    // Connect, bind media, register, start tasks. False if the vehicle is
    // unreachable or a mandatory task could not start.
    bool Start();

    // Idempotent.
    void Stop();

    core::ShutdownCoordinator& Coordinator() { return m_shutdown; }

private:
    std::unique_ptr<platform::IInputSource> makeInput();

private:
    core::OperatorConfig m_cfg{};

    core::ShutdownCoordinator m_shutdown;
    OperatorLink              m_link;
    StatusQueue               m_status_q{/*overwrite=*/true};

    std::unique_ptr<platform::IInputSource>  m_input;
    std::unique_ptr<platform::IFrameDisplay> m_display;

    std::unique_ptr<CommandSender>  m_sender;
    std::unique_ptr<StatusReceiver> m_status;
    std::unique_ptr<MediaReceiver>  m_media;

    CommandSender::TaskCtx  m_sender_ctx{};
    StatusReceiver::TaskCtx m_status_ctx{};
    MediaReceiver::TaskCtx  m_media_ctx{};

    Rtos::Task m_sender_task;
    Rtos::Task m_status_task;
    Rtos::Task m_media_task;

    bool m_started = false;
    bool m_stopped = false;
};

} // namespace station
