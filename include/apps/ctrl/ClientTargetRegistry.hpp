#pragma once
#include <cstdint>

#include "os/rtos.hpp"
#include "msg/ClientTarget.hpp"

namespace ctrl {

// Connection ids start at 1; 0 means "no owner".
static constexpr uint32_t NO_OWNER = 0;

// ---------------------------------------------------------------------------
// ClientTargetRegistry: the single media destination.
// Written by command connections, read every iteration by the media relay.
// The lock is held only for the copy in/out, never across I/O.
// ---------------------------------------------------------------------------
class ClientTargetRegistry {
public:
    // Replaces any previous target (last writer wins).
    void Set(const msg::ClientTarget& target, uint32_t owner_id);

    // False when no target is registered.
    bool Get(msg::ClientTarget& out) const;
    bool Get(msg::ClientTarget& out, uint32_t& owner_id) const;

    // Idempotent.
    void Clear();

    // Clears only if 'owner_id' registered the current target.
    // Returns true if something was cleared.
    bool ClearIfOwner(uint32_t owner_id);

private:
    mutable Rtos::Mutex m_lock;
    msg::ClientTarget   m_target{};
    uint32_t            m_owner = NO_OWNER;
    bool                m_valid = false;
};

} // namespace ctrl
