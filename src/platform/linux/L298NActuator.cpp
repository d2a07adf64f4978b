#include "platform/linux/L298NActuator.hpp"

#include <errno.h>
#include <string.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace platform {

static inline L298NConfig sanitise(const L298NConfig& in) {
    L298NConfig cfg = in;
    if (cfg.gpio_root.empty()) cfg.gpio_root = "/sys/class/gpio";
    if (cfg.pwm_chip.empty())  cfg.pwm_chip  = "/sys/class/pwm/pwmchip0";
    if (cfg.pwm_hz == 0)       cfg.pwm_hz = 1000;
    if (cfg.pwm_hz > 100000)   cfg.pwm_hz = 100000;
    return cfg;
}

const char* L298NActuator::StatusStr(Status s) {
    switch (s) {
        case Status::OK:              return "OK";
        case Status::EXPORT_FAIL:     return "EXPORT_FAIL";
        case Status::DIRECTION_FAIL:  return "DIRECTION_FAIL";
        case Status::WRITE_FAIL:      return "WRITE_FAIL";
        case Status::PWM_EXPORT_FAIL: return "PWM_EXPORT_FAIL";
        case Status::PWM_CONFIG_FAIL: return "PWM_CONFIG_FAIL";
        case Status::NOT_ARMED:       return "NOT_ARMED";
        default:                      return "UNKNOWN";
    }
}

L298NActuator::L298NActuator(const L298NConfig& cfg)
: m_cfg(sanitise(cfg)) {
    m_period_ns = 1000000000u / m_cfg.pwm_hz;
}

L298NActuator::~L298NActuator() {
    Close();
}

bool L298NActuator::Open() {
    m_status = Status::OK;
    m_errno  = 0;
    m_armed  = false;

    const uint32_t pins[] = {m_cfg.in1, m_cfg.in2, m_cfg.in3, m_cfg.in4};
    for (uint32_t pin : pins) {
        if (!exportGpio(pin)) break;
        if (!writeNode(gpioDir(pin) + "/direction", "out", Status::DIRECTION_FAIL)) break;
        if (!writeGpio(pin, false)) break;
    }

    if (m_status == Status::OK) {
        const uint32_t channels[] = {m_cfg.pwm_drive, m_cfg.pwm_steer};
        for (uint32_t ch : channels) {
            if (!exportPwm(ch)) break;
            // duty must never exceed period, so clear it before changing period
            if (!writeNode(pwmDir(ch) + "/duty_cycle", "0", Status::PWM_CONFIG_FAIL)) break;
            if (!writeNode(pwmDir(ch) + "/period", std::to_string(m_period_ns), Status::PWM_CONFIG_FAIL)) break;
            if (!writeNode(pwmDir(ch) + "/enable", "1", Status::PWM_CONFIG_FAIL)) break;
        }
    }

    if (m_status != Status::OK) {
        std::cerr << "[MOTOR] L298N unavailable: " << StatusStr(m_status)
                  << " errno=" << m_errno << " (" << ::strerror(m_errno) << ")"
                  << ", driving disabled\n";
        return false;
    }

    m_armed = true;
    std::cout << "[MOTOR] L298N armed: IN " << m_cfg.in1 << "/" << m_cfg.in2
              << " " << m_cfg.in3 << "/" << m_cfg.in4
              << " pwm " << m_cfg.pwm_drive << "/" << m_cfg.pwm_steer
              << " @" << m_cfg.pwm_hz << "Hz\n";
    return true;
}

void L298NActuator::Close() {
    if (!m_armed) return;

    writeDuty(m_cfg.pwm_drive, 0.0f);
    writeDuty(m_cfg.pwm_steer, 0.0f);
    writeGpio(m_cfg.in1, false);
    writeGpio(m_cfg.in2, false);
    writeGpio(m_cfg.in3, false);
    writeGpio(m_cfg.in4, false);
    writeNode(pwmDir(m_cfg.pwm_drive) + "/enable", "0", Status::PWM_CONFIG_FAIL);
    writeNode(pwmDir(m_cfg.pwm_steer) + "/enable", "0", Status::PWM_CONFIG_FAIL);

    m_armed = false;
    std::cout << "[MOTOR] L298N disarmed\n";
}

void L298NActuator::drive(const msg::MotionCommand& cmd) {
    if (!m_armed) {
        fail(Status::NOT_ARMED);
        return;
    }

    bool ok = true;

    // Bridge A: drive motor
    switch (cmd.direction) {
        case msg::Direction::FORWARD:
            ok &= writeGpio(m_cfg.in1, true);
            ok &= writeGpio(m_cfg.in2, false);
            ok &= writeDuty(m_cfg.pwm_drive, cmd.speed);
            break;
        case msg::Direction::BACKWARD:
            ok &= writeGpio(m_cfg.in1, false);
            ok &= writeGpio(m_cfg.in2, true);
            ok &= writeDuty(m_cfg.pwm_drive, cmd.speed);
            break;
        default:
            ok &= writeDuty(m_cfg.pwm_drive, 0.0f);
            ok &= writeGpio(m_cfg.in1, false);
            ok &= writeGpio(m_cfg.in2, false);
            break;
    }

    // Bridge B: steering motor, positive = right
    if (cmd.steering > 0.0f) {
        ok &= writeGpio(m_cfg.in3, true);
        ok &= writeGpio(m_cfg.in4, false);
    } else if (cmd.steering < 0.0f) {
        ok &= writeGpio(m_cfg.in3, false);
        ok &= writeGpio(m_cfg.in4, true);
    } else {
        ok &= writeGpio(m_cfg.in3, false);
        ok &= writeGpio(m_cfg.in4, false);
    }
    ok &= writeDuty(m_cfg.pwm_steer, std::fabs(cmd.steering));

    if (!ok) {
        std::cerr << "[MOTOR] L298N write failed: " << StatusStr(m_status)
                  << " errno=" << m_errno << "\n";
    }
}

std::string L298NActuator::gpioDir(uint32_t pin) const {
    return m_cfg.gpio_root + "/gpio" + std::to_string(pin);
}

std::string L298NActuator::pwmDir(uint32_t channel) const {
    return m_cfg.pwm_chip + "/pwm" + std::to_string(channel);
}

bool L298NActuator::exportGpio(uint32_t pin) {
    std::error_code ec;
    if (fs::exists(gpioDir(pin), ec)) return true;   // already exported
    if (!writeNode(m_cfg.gpio_root + "/export", std::to_string(pin), Status::EXPORT_FAIL)) {
        return false;
    }
    if (!fs::exists(gpioDir(pin), ec)) return fail(Status::EXPORT_FAIL);
    return true;
}

bool L298NActuator::exportPwm(uint32_t channel) {
    std::error_code ec;
    if (fs::exists(pwmDir(channel), ec)) return true;
    if (!writeNode(m_cfg.pwm_chip + "/export", std::to_string(channel), Status::PWM_EXPORT_FAIL)) {
        return false;
    }
    if (!fs::exists(pwmDir(channel), ec)) return fail(Status::PWM_EXPORT_FAIL);
    return true;
}

bool L298NActuator::writeGpio(uint32_t pin, bool high) {
    return writeNode(gpioDir(pin) + "/value", high ? "1" : "0", Status::WRITE_FAIL);
}

bool L298NActuator::writeDuty(uint32_t channel, float fraction) {
    if (fraction < 0.0f) fraction = 0.0f;
    if (fraction > 1.0f) fraction = 1.0f;
    const uint32_t duty_ns = static_cast<uint32_t>(std::lround(fraction * static_cast<float>(m_period_ns)));
    return writeNode(pwmDir(channel) + "/duty_cycle", std::to_string(duty_ns), Status::WRITE_FAIL);
}

bool L298NActuator::writeNode(const std::string& path, const std::string& value, Status on_fail) {
    errno = 0;
    std::ofstream ofs(path);
    if (!ofs) return fail(on_fail);
    ofs << value;
    ofs.flush();
    if (!ofs.good()) return fail(on_fail);
    return true;
}

bool L298NActuator::fail(Status s) {
    m_status = s;
    m_errno  = errno;
    return false;
}

} // namespace platform
