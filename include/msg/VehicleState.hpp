#pragma once
#include <cstdint>

#include "msg/MotionCommand.hpp"

namespace msg {

// Last-applied actuation values. Always the most recently dispatched
// MotionCommand, already clamped.
struct VehicleState {
    Direction direction = Direction::STOP;
    float     speed     = 0.0f;
    float     steering  = 0.0f;
    uint32_t  applied_count = 0;   // number of commands applied so far
};

// Snapshot carried by the status reply (vehicle -> operator).
struct StatusReport {
    int      battery  = 0;     // percent; constant placeholder on the vehicle
    float    speed    = 0.0f;
    float    steering = 0.0f;
    uint64_t rx_us    = 0;     // operator-side receive time (Rtos::NowUs)
};

// Health value reported until a battery monitor exists.
static constexpr int BATTERY_PLACEHOLDER = 100;

} // namespace msg
