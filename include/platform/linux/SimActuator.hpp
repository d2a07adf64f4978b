#pragma once
#include "platform/IActuator.hpp"

namespace platform {

// Logs every drive call. Used on bench machines without a motor driver.
class SimActuator : public IActuator {
public:
    bool Open() override;
    void Close() override;
    const char* Name() const override { return "sim"; }

protected:
    void drive(const msg::MotionCommand& cmd) override;
};

} // namespace platform
