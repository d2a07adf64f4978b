#include "apps/ctrl/ClientTargetRegistry.hpp"

#include <iostream>
#include <mutex>

namespace ctrl {

void ClientTargetRegistry::Set(const msg::ClientTarget& target, uint32_t owner_id) {
    msg::ClientTarget previous{};
    bool had_previous = false;
    {
        std::lock_guard<Rtos::Mutex> lk(m_lock);
        had_previous = m_valid;
        previous     = m_target;
        m_target = target;
        m_owner  = owner_id;
        m_valid  = true;
    }

    std::cout << "[REGISTRY] target " << target.host << ":" << target.port
              << " owner=" << owner_id;
    if (had_previous && previous != target) {
        std::cout << " (replaces " << previous.host << ":" << previous.port << ")";
    }
    std::cout << "\n";
}

bool ClientTargetRegistry::Get(msg::ClientTarget& out) const {
    std::lock_guard<Rtos::Mutex> lk(m_lock);
    if (!m_valid) return false;
    out = m_target;
    return true;
}

bool ClientTargetRegistry::Get(msg::ClientTarget& out, uint32_t& owner_id) const {
    std::lock_guard<Rtos::Mutex> lk(m_lock);
    if (!m_valid) return false;
    out      = m_target;
    owner_id = m_owner;
    return true;
}

void ClientTargetRegistry::Clear() {
    bool cleared = false;
    {
        std::lock_guard<Rtos::Mutex> lk(m_lock);
        cleared  = m_valid;
        m_valid  = false;
        m_owner  = NO_OWNER;
        m_target = msg::ClientTarget{};
    }
    if (cleared) std::cout << "[REGISTRY] target cleared\n";
}

bool ClientTargetRegistry::ClearIfOwner(uint32_t owner_id) {
    if (owner_id == NO_OWNER) return false;
    {
        std::lock_guard<Rtos::Mutex> lk(m_lock);
        if (!m_valid || m_owner != owner_id) return false;
        m_valid  = false;
        m_owner  = NO_OWNER;
        m_target = msg::ClientTarget{};
    }
    std::cout << "[REGISTRY] target cleared, owner=" << owner_id << " disconnected\n";
    return true;
}

} // namespace ctrl
