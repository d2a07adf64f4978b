// Actuator base clamping/state and the L298N driver against a fake sysfs tree.

#include <stdlib.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "platform/linux/ActuatorFactory.hpp"
#include "platform/linux/L298NActuator.hpp"
#include "platform/linux/SimActuator.hpp"

namespace fs = std::filesystem;

static std::string readNode(const fs::path& p) {
    std::ifstream ifs(p);
    std::string v;
    ifs >> v;
    return v;
}

static msg::MotionCommand cmd(msg::Direction d, float speed, float steering) {
    msg::MotionCommand c{};
    c.direction = d;
    c.speed = speed;
    c.steering = steering;
    return c;
}

int main() {
    std::cout << "=== platform_actuator_test ===\n";

    std::cout << "\n[Test 0] base class clamps and records state\n";
    {
        platform::SimActuator sim;
        sim.Open();
        sim.Apply(cmd(msg::Direction::FORWARD, 1.7f, -4.0f));
        auto s = sim.State();
        if (s.direction != msg::Direction::FORWARD || s.speed != 1.0f || s.steering != -1.0f ||
            s.applied_count != 1) {
            std::cout << "clamp: FAIL\n";
            return 1;
        }
        sim.Apply(cmd(msg::Direction::BACKWARD, std::nanf(""), 0.3f));
        s = sim.State();
        if (s.speed != 0.0f || std::fabs(s.steering - 0.3f) > 1e-6f || s.applied_count != 2) {
            std::cout << "nan: FAIL\n";
            return 1;
        }
        sim.Apply(cmd(msg::Direction::STOP, 0.9f, 0.9f));
        s = sim.State();
        if (s.direction != msg::Direction::STOP || s.speed != 0.0f || s.steering != 0.0f) {
            std::cout << "stop zeroes: FAIL\n";
            return 1;
        }
        sim.Close();
        std::cout << "clamp: OK\n";
    }

    std::cout << "\n[Test 1] factory and kind names\n";
    {
        platform::ActuatorKind k = platform::ActuatorKind::SIM;
        if (!platform::ParseActuatorKind("l298n", k) || k != platform::ActuatorKind::L298N ||
            platform::ParseActuatorKind("servo", k) ||
            std::string(platform::ActuatorKindStr(platform::ActuatorKind::SIM)) != "sim") {
            std::cout << "kinds: FAIL\n";
            return 1;
        }
        auto a = platform::CreateActuator(platform::ActuatorKind::SIM);
        auto b = platform::CreateActuator(platform::ActuatorKind::L298N);
        if (!a || !b || std::string(a->Name()) != "sim" || std::string(b->Name()) != "l298n") {
            std::cout << "factory: FAIL\n";
            return 1;
        }
        std::cout << "factory: OK\n";
    }

    char tmpl[] = "/tmp/roverlink_sysfs_XXXXXX";
    if (!::mkdtemp(tmpl)) {
        std::cout << "mkdtemp: FAIL\n";
        return 1;
    }
    const fs::path root(tmpl);

    std::cout << "\n[Test 2] missing sysfs leaves the driver disarmed\n";
    {
        platform::L298NConfig cfg{};
        cfg.gpio_root = (root / "absent/gpio").string();
        cfg.pwm_chip  = (root / "absent/pwmchip0").string();
        platform::L298NActuator hw(cfg);
        if (hw.Open() || hw.Armed()) {
            std::cout << "disarmed: FAIL\n";
            return 1;
        }
        hw.Apply(cmd(msg::Direction::FORWARD, 0.5f, 0.0f));
        if (hw.lastStatus() != platform::L298NActuator::Status::NOT_ARMED ||
            hw.State().speed != 0.5f) {
            std::cout << "no-op drive: FAIL status=" << platform::L298NActuator::StatusStr(hw.lastStatus()) << "\n";
            return 1;
        }
        std::cout << "disarmed: OK\n";
    }

    std::cout << "\n[Test 3] armed driver writes pins and duty\n";
    {
        const fs::path gpio = root / "gpio";
        const fs::path pwm  = root / "pwmchip0";
        for (int pin : {17, 27, 23, 24}) fs::create_directories(gpio / ("gpio" + std::to_string(pin)));
        for (int ch : {0, 1}) fs::create_directories(pwm / ("pwm" + std::to_string(ch)));

        platform::L298NConfig cfg{};
        cfg.gpio_root = gpio.string();
        cfg.pwm_chip  = pwm.string();
        cfg.pwm_hz    = 1000;   // 1 ms period
        platform::L298NActuator hw(cfg);
        if (!hw.Open() || !hw.Armed()) {
            std::cout << "arm: FAIL status=" << platform::L298NActuator::StatusStr(hw.lastStatus()) << "\n";
            return 1;
        }
        if (readNode(gpio / "gpio17/direction") != "out" || readNode(pwm / "pwm0/period") != "1000000" ||
            readNode(pwm / "pwm1/enable") != "1") {
            std::cout << "setup nodes: FAIL\n";
            return 1;
        }

        hw.Apply(cmd(msg::Direction::FORWARD, 0.5f, -0.25f));
        if (readNode(gpio / "gpio17/value") != "1" || readNode(gpio / "gpio27/value") != "0" ||
            readNode(pwm / "pwm0/duty_cycle") != "500000" ||
            readNode(gpio / "gpio23/value") != "0" || readNode(gpio / "gpio24/value") != "1" ||
            readNode(pwm / "pwm1/duty_cycle") != "250000") {
            std::cout << "forward: FAIL\n";
            return 1;
        }

        hw.Apply(cmd(msg::Direction::BACKWARD, 2.0f, 0.5f));   // clamped to full duty
        if (readNode(gpio / "gpio17/value") != "0" || readNode(gpio / "gpio27/value") != "1" ||
            readNode(pwm / "pwm0/duty_cycle") != "1000000" ||
            readNode(gpio / "gpio23/value") != "1" || readNode(pwm / "pwm1/duty_cycle") != "500000") {
            std::cout << "backward: FAIL\n";
            return 1;
        }

        hw.Stop();
        if (readNode(pwm / "pwm0/duty_cycle") != "0" || readNode(pwm / "pwm1/duty_cycle") != "0" ||
            readNode(gpio / "gpio17/value") != "0" || readNode(gpio / "gpio27/value") != "0") {
            std::cout << "stop: FAIL\n";
            return 1;
        }

        hw.Close();
        if (hw.Armed() || readNode(pwm / "pwm0/enable") != "0") {
            std::cout << "close: FAIL\n";
            return 1;
        }
        std::cout << "armed: OK\n";
    }

    std::error_code ec;
    fs::remove_all(root, ec);

    std::cout << "\n[Main] Test complete.\n";
    return 0;
}
