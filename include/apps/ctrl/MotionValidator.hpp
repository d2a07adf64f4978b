#pragma once
#include <string>

#include "msg/Message.hpp"
#include "msg/MotionCommand.hpp"

namespace ctrl {

// Range limits for a validated MotionCommand.
static constexpr float SPEED_MIN    = 0.0f;
static constexpr float SPEED_MAX    = 1.0f;
static constexpr float STEERING_MIN = -1.0f;
static constexpr float STEERING_MAX = 1.0f;

// ---------------------------------------------------------------------------
// MotionValidator: Message -> MotionCommand. Never fails.
//   move : direction (default/unknown -> stop), speed, steering (absent or
//          non-numeric -> 0), clamped. stop direction zeroes the command.
//   stop : zero command, other fields ignored.
//   other: zero command.
// ---------------------------------------------------------------------------
class MotionValidator {
public:
    static msg::MotionCommand Validate(const msg::Message& m);

    // Operator side: build the "move" message for an already-mapped command.
    static msg::Message ToMessage(const msg::MotionCommand& c);

    static msg::Direction ParseDirection(const std::string& s);

    // NaN maps to lo.
    static float Clamp(float v, float lo, float hi);
};

} // namespace ctrl
