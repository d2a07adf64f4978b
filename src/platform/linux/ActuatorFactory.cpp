#include "platform/linux/ActuatorFactory.hpp"
#include "platform/linux/SimActuator.hpp"

namespace platform {

std::unique_ptr<IActuator> CreateActuator(ActuatorKind kind, const L298NConfig& hw_cfg) {
    switch (kind) {
        case ActuatorKind::L298N:
            return std::make_unique<L298NActuator>(hw_cfg);
        case ActuatorKind::SIM:
        default:
            return std::make_unique<SimActuator>();
    }
}

} // namespace platform
