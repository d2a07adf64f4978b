#include "platform/IActuator.hpp"

#include <cmath>
#include <mutex>

namespace {

float clampf(float v, float lo, float hi) {
    if (std::isnan(v)) return 0.0f;
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

} // anonymous namespace

namespace platform {

const char* ActuatorKindStr(ActuatorKind k) {
    switch (k) {
        case ActuatorKind::SIM:   return "sim";
        case ActuatorKind::L298N: return "l298n";
        default:                  return "unknown";
    }
}

bool ParseActuatorKind(const std::string& s, ActuatorKind& out) {
    if (s == "sim")   { out = ActuatorKind::SIM;   return true; }
    if (s == "l298n") { out = ActuatorKind::L298N; return true; }
    return false;
}

void IActuator::Apply(const msg::MotionCommand& cmd) {
    msg::MotionCommand c = cmd;
    c.speed    = clampf(c.speed, 0.0f, 1.0f);
    c.steering = clampf(c.steering, -1.0f, 1.0f);
    if (c.direction == msg::Direction::STOP) {
        c = msg::MotionCommand::Zero();
    }

    std::lock_guard<Rtos::Mutex> lk(m_lock);
    m_state.direction = c.direction;
    m_state.speed     = c.speed;
    m_state.steering  = c.steering;
    m_state.applied_count++;
    drive(c);
}

msg::VehicleState IActuator::State() const {
    std::lock_guard<Rtos::Mutex> lk(m_lock);
    return m_state;
}

} // namespace platform
