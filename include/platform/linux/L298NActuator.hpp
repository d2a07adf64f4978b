#pragma once
#include <cstdint>
#include <string>

#include "platform/IActuator.hpp"

namespace platform {

// ------------------------------
// Config
// ------------------------------
struct L298NConfig {
    // sysfs roots (overridable for bench tests)
    std::string gpio_root = "/sys/class/gpio";
    std::string pwm_chip  = "/sys/class/pwm/pwmchip0";

    // BCM pin numbers. IN1/IN2 select drive direction, IN3/IN4 steering.
    uint32_t in1 = 17;
    uint32_t in2 = 27;
    uint32_t in3 = 23;
    uint32_t in4 = 24;

    // Hardware PWM channels feeding ENA (drive) and ENB (steering).
    uint32_t pwm_drive = 0;
    uint32_t pwm_steer = 1;

    uint32_t pwm_hz = 1000;
};

// ------------------------------
// L298NActuator: drive motor on bridge A, steering motor on bridge B.
// Duty cycle = |value|; sign selects the IN pin pair.
// If any sysfs node is missing at Open() the actuator stays disarmed and
// drive() is a no-op.
// ------------------------------
class L298NActuator : public IActuator {
public:
    explicit L298NActuator(const L298NConfig& cfg = {});
    ~L298NActuator() override;

    bool Open() override;
    void Close() override;
    const char* Name() const override { return "l298n"; }

    bool Armed() const { return m_armed; }

    enum class Status : uint8_t {
        OK = 0,
        // SYSCALL FAILS
        EXPORT_FAIL,
        DIRECTION_FAIL,
        WRITE_FAIL,
        PWM_EXPORT_FAIL,
        PWM_CONFIG_FAIL,

        // LOGIC FAILS
        NOT_ARMED,
    };

    static const char* StatusStr(Status s);

    Status lastStatus() const { return m_status; }
    int    lastErrno()  const { return m_errno; }

protected:
    void drive(const msg::MotionCommand& cmd) override;

private:
    L298NConfig m_cfg{};
    uint32_t m_period_ns = 0;
    bool m_armed = false;

    // FDIR
    Status m_status = Status::OK;
    int    m_errno  = 0;

private:
    bool exportGpio(uint32_t pin);
    bool exportPwm(uint32_t channel);
    bool writeGpio(uint32_t pin, bool high);
    bool writeDuty(uint32_t channel, float fraction);
    bool writeNode(const std::string& path, const std::string& value, Status on_fail);

    std::string gpioDir(uint32_t pin) const;
    std::string pwmDir(uint32_t channel) const;

    bool fail(Status s);
};

} // namespace platform
