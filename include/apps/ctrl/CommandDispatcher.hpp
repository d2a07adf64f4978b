#pragma once
#include <cstdint>
#include <string>

#include "msg/Message.hpp"
#include "msg/VehicleState.hpp"
#include "apps/ctrl/ClientTargetRegistry.hpp"
#include "apps/core/ShutdownCoordinator.hpp"
#include "platform/IActuator.hpp"

namespace ctrl {

enum class DispatchStatus : uint8_t {
    OK = 0,
    PROTOCOL_ERROR,       // unknown or inbound-only tag; ignored
    REGISTRATION_ERROR,   // register_video with a bad port; error reply set
    QUIT,                 // shutdown requested; caller ends its loop
};

const char* DispatchStatusStr(DispatchStatus s);

// Who sent the message. conn_id is the registry owner id for this connection.
struct PeerInfo {
    std::string host;
    uint32_t    conn_id = NO_OWNER;
};

// ---------------------------------------------------------------------------
// CommandDispatcher: applies one decoded message.
// Shared by every connection task; holds no per-connection state, so the
// only serialisation is inside the registry and the actuator.
// ---------------------------------------------------------------------------
class CommandDispatcher {
public:
    CommandDispatcher(ClientTargetRegistry& registry,
                      platform::IActuator& actuator,
                      core::ShutdownCoordinator* shutdown);

    // 'reply' is cleared, then set to an encoded frame when the sender must
    // get an answer on the same connection (status, rejected registration).
    DispatchStatus Dispatch(const msg::Message& m, const PeerInfo& peer, std::string& reply);

    static msg::Message MakeStatusReport(const msg::VehicleState& s);
    static msg::Message MakeError(const std::string& reason);

    // register_video port: integer, integral float or numeric string.
    // 0 when absent or unparsable.
    static long ReadVideoPort(const nlohmann::json& body);

private:
    ClientTargetRegistry&      m_registry;
    platform::IActuator&       m_actuator;
    core::ShutdownCoordinator* m_shutdown = nullptr;
};

} // namespace ctrl
