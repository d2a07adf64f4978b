#include "apps/ctrl/CommandDispatcher.hpp"
#include "apps/ctrl/FrameCodec.hpp"
#include "apps/ctrl/MotionValidator.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iostream>

namespace ctrl {

const char* DispatchStatusStr(DispatchStatus s) {
    switch (s) {
        case DispatchStatus::OK:                 return "OK";
        case DispatchStatus::PROTOCOL_ERROR:     return "PROTOCOL_ERROR";
        case DispatchStatus::REGISTRATION_ERROR: return "REGISTRATION_ERROR";
        case DispatchStatus::QUIT:               return "QUIT";
        default:                                 return "UNKNOWN";
    }
}

CommandDispatcher::CommandDispatcher(ClientTargetRegistry& registry,
                                     platform::IActuator& actuator,
                                     core::ShutdownCoordinator* shutdown)
: m_registry(registry)
, m_actuator(actuator)
, m_shutdown(shutdown) {}

long CommandDispatcher::ReadVideoPort(const nlohmann::json& body) {
    auto it = body.find("video_port");
    if (it == body.end()) return 0;

    if (it->is_number_integer()) {
        const int64_t v = it->get<int64_t>();
        if (v < 0 || v > 0x7FFFFFFF) return -1;
        return static_cast<long>(v);
    }
    if (it->is_number_float()) {
        const double d = it->get<double>();
        if (!std::isfinite(d) || d < 0.0 || d > 2147483647.0) return -1;
        return static_cast<long>(d);   // truncates
    }
    if (it->is_string()) {
        const std::string s = it->get<std::string>();
        errno = 0;
        char* end = nullptr;
        const long v = std::strtol(s.c_str(), &end, 10);
        if (s.empty() || errno != 0 || !end || *end != '\0') return 0;
        return v;
    }
    return 0;
}

msg::Message CommandDispatcher::MakeStatusReport(const msg::VehicleState& s) {
    msg::Message m = msg::MakeMessage(msg::CmdType::STATUS_REPORT);
    m.body["battery"]  = msg::BATTERY_PLACEHOLDER;
    m.body["speed"]    = s.speed;
    m.body["steering"] = s.steering;
    return m;
}

msg::Message CommandDispatcher::MakeError(const std::string& reason) {
    msg::Message m = msg::MakeMessage(msg::CmdType::ERROR);
    m.body["reason"] = reason;
    return m;
}

DispatchStatus CommandDispatcher::Dispatch(const msg::Message& m, const PeerInfo& peer, std::string& reply) {
    reply.clear();

    switch (m.type) {
        case msg::CmdType::REGISTER_VIDEO: {
            const long port = ReadVideoPort(m.body);
            if (port <= 0 || port > 65535) {
                std::cerr << "[DISPATCH] conn " << peer.conn_id << " " << peer.host
                          << ": invalid video_port " << port << ", registration rejected\n";
                reply = FrameCodec::Encode(MakeError("invalid video_port"));
                return DispatchStatus::REGISTRATION_ERROR;
            }
            msg::ClientTarget t{};
            t.host = peer.host;
            t.port = static_cast<uint16_t>(port);
            m_registry.Set(t, peer.conn_id);
            return DispatchStatus::OK;
        }

        case msg::CmdType::MOVE: {
            const msg::MotionCommand c = MotionValidator::Validate(m);
            m_actuator.Apply(c);
            return DispatchStatus::OK;
        }

        case msg::CmdType::STOP:
            m_actuator.Stop();
            return DispatchStatus::OK;

        case msg::CmdType::STATUS:
            reply = FrameCodec::Encode(MakeStatusReport(m_actuator.State()));
            return DispatchStatus::OK;

        case msg::CmdType::QUIT:
            std::cout << "[DISPATCH] quit from conn " << peer.conn_id << " " << peer.host << "\n";
            // Leave the motors safe before the process winds down.
            m_actuator.Stop();
            if (m_shutdown) {
                m_shutdown->RequestShutdown("quit command");
            }
            return DispatchStatus::QUIT;

        default:
            std::cerr << "[DISPATCH] conn " << peer.conn_id << " " << peer.host
                      << ": ignoring command '" << m.cmd << "'\n";
            return DispatchStatus::PROTOCOL_ERROR;
    }
}

} // namespace ctrl
