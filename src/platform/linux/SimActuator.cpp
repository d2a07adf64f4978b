#include "platform/linux/SimActuator.hpp"

#include <iomanip>
#include <iostream>

namespace platform {

bool SimActuator::Open() {
    std::cout << "[MOTOR] simulated actuator ready\n";
    return true;
}

void SimActuator::Close() {
    std::cout << "[MOTOR] simulated actuator closed\n";
}

void SimActuator::drive(const msg::MotionCommand& cmd) {
    std::cout << "[MOTOR] SIM " << msg::DirectionStr(cmd.direction)
              << std::fixed << std::setprecision(2)
              << " speed=" << cmd.speed
              << " steering=" << cmd.steering
              << std::defaultfloat << "\n";
}

} // namespace platform
