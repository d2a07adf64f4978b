#include "OperatorStation.hpp"

#include <iostream>

#include "platform/linux/JoystickInput.hpp"
#include "platform/linux/KeyboardInput.hpp"
#include "platform/linux/OpenCvDisplay.hpp"

namespace station {

OperatorStation::OperatorStation(const core::OperatorConfig& cfg)
: m_cfg(core::sanitise(cfg)) {}

OperatorStation::~OperatorStation() {
    Stop();
}

std::unique_ptr<platform::IInputSource> OperatorStation::makeInput() {
    std::unique_ptr<platform::IInputSource> in;
    switch (m_cfg.input) {
        case core::InputKind::JOYSTICK: {
            platform::JoystickConfig jcfg{};
            jcfg.dev = m_cfg.joystick_dev;
            in = std::make_unique<platform::JoystickInput>(jcfg);
            break;
        }
        case core::InputKind::KEYBOARD:
            in = std::make_unique<platform::KeyboardInput>();
            break;
        case core::InputKind::NONE:
        default:
            return nullptr;
    }

    if (!in->Open()) {
        std::cerr << "[OPERATOR] " << core::InputKindStr(m_cfg.input)
                  << " unavailable, no local control (status only)\n";
        return nullptr;
    }
    return in;
}

bool OperatorStation::Start() {
    if (m_started) return true;

    // ---- Media receiver first: its port goes into register_video ----
    MediaReceiverConfig mcfg{};
    mcfg.port = static_cast<uint16_t>(m_cfg.video_port);
    m_display = std::make_unique<platform::OpenCvDisplay>("RoverLink " + m_cfg.server_ip);
    m_media   = std::make_unique<MediaReceiver>(mcfg, m_display.get(), &m_shutdown);
    const bool media_ok = m_media->Open();
    if (!media_ok) {
        std::cerr << "[OPERATOR] continuing without video\n";
    }

    // ---- Command link ----
    if (!m_link.Connect(m_cfg.server_ip, static_cast<uint16_t>(m_cfg.server_port))) {
        return false;
    }

    if (media_ok) {
        msg::Message reg = msg::MakeMessage(msg::CmdType::REGISTER_VIDEO);
        reg.body["video_port"] = m_media->BoundPort();
        if (!m_link.SendMessage(reg)) {
            std::cerr << "[OPERATOR] register_video failed\n";
            m_link.Close();
            return false;
        }
        std::cout << "[OPERATOR] registered for video on UDP " << m_media->BoundPort() << "\n";
    }

    // ---- Tasks ----
    m_input = makeInput();

    CommandSenderConfig scfg{};
    scfg.status_ms = m_cfg.status_ms;
    m_sender = std::make_unique<CommandSender>(scfg, m_link, m_input.get(), &m_shutdown);
    m_status = std::make_unique<StatusReceiver>(m_link, &m_shutdown);

    m_shutdown.AddStopHook("command sender", CommandSender::StopHook, m_sender.get());
    m_shutdown.AddStopHook("media receiver", MediaReceiver::StopHook, m_media.get());

    m_sender_ctx.self = m_sender.get();
    m_status_ctx.self = m_status.get();
    m_status_ctx.status_out = &m_status_q;
    m_media_ctx.self = m_media.get();
    m_media_ctx.status_in = &m_status_q;

    m_started = true;

    if (!m_status_task.Create("StatusReceiver", StatusReceiver::TaskEntry, &m_status_ctx)) {
        m_shutdown.RequestShutdown("status receiver task failed");
        return false;
    }
    m_shutdown.AddTask("StatusReceiver", &m_status_task);

    if (!m_sender_task.Create("CommandSender", CommandSender::TaskEntry, &m_sender_ctx)) {
        m_shutdown.RequestShutdown("command sender task failed");
        return false;
    }
    m_shutdown.AddTask("CommandSender", &m_sender_task);

    if (media_ok) {
        if (m_media_task.Create("MediaReceiver", MediaReceiver::TaskEntry, &m_media_ctx)) {
            m_shutdown.AddTask("MediaReceiver", &m_media_task);
        } else {
            std::cerr << "[OPERATOR] media receiver task failed, continuing without video\n";
        }
    }
    return true;
}

void OperatorStation::Stop() {
    if (!m_started || m_stopped) return;
    m_stopped = true;

    m_shutdown.RequestShutdown("operator exit");

    // Sender goes first so its final stop reaches the vehicle before quit.
    if (m_sender_task.IsCreated() && !m_sender_task.JoinFor(m_cfg.join_timeout_ms)) {
        std::cerr << "[OPERATOR] command sender did not stop in time\n";
    }

    if (m_cfg.send_quit_on_exit) {
        if (m_link.SendMessage(msg::MakeMessage(msg::CmdType::QUIT))) {
            std::cout << "[OPERATOR] quit sent to vehicle\n";
        } else {
            std::cerr << "[OPERATOR] could not send quit (link down)\n";
        }
    }

    m_status->RequestStop();
    m_link.Shutdown();

    const std::size_t stuck = m_shutdown.JoinAll(m_cfg.join_timeout_ms);
    if (stuck > 0) {
        std::cerr << "[OPERATOR] " << stuck << " task(s) still running at exit\n";
    }

    if (m_input) m_input->Close();
    if (stuck == 0) m_link.Close();
    std::cout << "[OPERATOR] session closed, frames sent=" << m_link.FramesSent() << "\n";
}

} // namespace station
