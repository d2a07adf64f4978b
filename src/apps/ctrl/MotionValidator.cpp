#include "apps/ctrl/MotionValidator.hpp"

#include <cfloat>
#include <cmath>

namespace {

// Numeric field or fallback. Booleans are not numbers here; NaN is treated
// as absent.
float number_or(const nlohmann::json& body, const char* key, float fallback) {
    auto it = body.find(key);
    if (it == body.end() || !it->is_number()) return fallback;
    const double v = it->get<double>();
    if (std::isnan(v)) return fallback;
    // saturate before narrowing
    if (v > FLT_MAX)  return FLT_MAX;
    if (v < -FLT_MAX) return -FLT_MAX;
    return static_cast<float>(v);
}

} // anonymous namespace

namespace ctrl {

float MotionValidator::Clamp(float v, float lo, float hi) {
    if (std::isnan(v)) return lo;
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

msg::Direction MotionValidator::ParseDirection(const std::string& s) {
    if (s == "forward")  return msg::Direction::FORWARD;
    if (s == "backward") return msg::Direction::BACKWARD;
    return msg::Direction::STOP;
}

msg::MotionCommand MotionValidator::Validate(const msg::Message& m) {
    if (m.type != msg::CmdType::MOVE || !m.body.is_object()) {
        return msg::MotionCommand::Zero();
    }

    msg::MotionCommand c{};

    auto dir = m.body.find("direction");
    if (dir != m.body.end() && dir->is_string()) {
        c.direction = ParseDirection(dir->get<std::string>());
    }
    if (c.direction == msg::Direction::STOP) {
        return msg::MotionCommand::Zero();
    }

    c.speed    = Clamp(number_or(m.body, "speed", 0.0f),    SPEED_MIN,    SPEED_MAX);
    c.steering = Clamp(number_or(m.body, "steering", 0.0f), STEERING_MIN, STEERING_MAX);
    return c;
}

msg::Message MotionValidator::ToMessage(const msg::MotionCommand& c) {
    msg::Message m = msg::MakeMessage(msg::CmdType::MOVE);
    m.body["direction"] = msg::DirectionStr(c.direction);
    m.body["speed"]     = Clamp(c.speed, SPEED_MIN, SPEED_MAX);
    m.body["steering"]  = Clamp(c.steering, STEERING_MIN, STEERING_MAX);
    return m;
}

} // namespace ctrl
