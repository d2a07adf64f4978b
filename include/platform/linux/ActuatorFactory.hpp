#pragma once
#include <memory>

#include "platform/IActuator.hpp"
#include "platform/linux/L298NActuator.hpp"

namespace platform {

// Variant is fixed at construction; there is no runtime fallback between
// variants.
std::unique_ptr<IActuator> CreateActuator(ActuatorKind kind, const L298NConfig& hw_cfg = {});

} // namespace platform
