#pragma once
#include <cstdint>

namespace msg {

enum class Direction : uint8_t {
    STOP = 0,
    FORWARD,
    BACKWARD,
};

// Validated motion intent.
// speed    in [0, 1]   (magnitude; direction carries the sign)
// steering in [-1, 1]  (negative = left, positive = right)
struct MotionCommand {
    Direction direction = Direction::STOP;
    float     speed     = 0.0f;
    float     steering  = 0.0f;

    static constexpr MotionCommand Zero() { return MotionCommand{}; }
};

inline const char* DirectionStr(Direction d) {
    switch (d) {
        case Direction::FORWARD:  return "forward";
        case Direction::BACKWARD: return "backward";
        default:                  return "stop";
    }
}

} // namespace msg
