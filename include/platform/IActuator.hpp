#pragma once
#include <cstdint>
#include <string>

#include "os/rtos.hpp"
#include "msg/MotionCommand.hpp"
#include "msg/VehicleState.hpp"

namespace platform {

enum class ActuatorKind : uint8_t {
    SIM = 0,    // log only
    L298N,      // dual H-bridge on sysfs GPIO + PWM
};

const char* ActuatorKindStr(ActuatorKind k);
bool ParseActuatorKind(const std::string& s, ActuatorKind& out);

// ---------------------------------------------------------------------------
// IActuator: drive + steering motors.
// Apply() may be called from several command connections at once; the base
// class serialises it and owns VehicleState. Variants only implement drive().
// ---------------------------------------------------------------------------
class IActuator {
public:
    virtual ~IActuator() = default;

    // Claims the hardware. False when unavailable; Apply() then only tracks
    // state.
    virtual bool Open() = 0;
    virtual void Close() = 0;
    virtual const char* Name() const = 0;

    // Clamps, records as the new VehicleState, then drives.
    void Apply(const msg::MotionCommand& cmd);
    void Stop() { Apply(msg::MotionCommand::Zero()); }

    msg::VehicleState State() const;

protected:
    // Called with the state lock held; keep it short and non-blocking.
    virtual void drive(const msg::MotionCommand& cmd) = 0;

private:
    mutable Rtos::Mutex m_lock;
    msg::VehicleState   m_state{};
};

} // namespace platform
