// Operator-side input mapping, send throttling and input device faults.

#include <errno.h>
#include <stdlib.h>
#include <unistd.h>

#include <cmath>
#include <fstream>
#include <iostream>

#include "apps/station/CommandSender.hpp"
#include "platform/linux/JoystickInput.hpp"
#include "platform/linux/KeyboardInput.hpp"

using station::CommandFilter;

static bool near(float a, float b) { return std::fabs(a - b) < 1e-4f; }

static platform::InputSample sample(float throttle, float steering) {
    platform::InputSample s;
    s.throttle = throttle;
    s.steering = steering;
    return s;
}

int main() {
    std::cout << "=== station_commandfilter_test ===\n";

    std::cout << "\n[Test 0] Map: dead zone, sign, steering only\n";
    {
        CommandFilter f;
        const auto idle = f.Map(sample(0.05f, -0.08f));
        const auto fwd  = f.Map(sample(0.6f, 0.3f));
        const auto back = f.Map(sample(-0.4f, -0.2f));
        const auto turn = f.Map(sample(0.0f, 0.7f));
        const auto sat  = f.Map(sample(3.0f, -2.0f));
        const auto nan  = f.Map(sample(std::nanf(""), 0.0f));

        const bool ok =
            idle.direction == msg::Direction::STOP && idle.speed == 0.0f && idle.steering == 0.0f &&
            fwd.direction == msg::Direction::FORWARD && near(fwd.speed, 0.6f) && near(fwd.steering, 0.3f) &&
            back.direction == msg::Direction::BACKWARD && near(back.speed, 0.4f) && near(back.steering, -0.2f) &&
            turn.direction == msg::Direction::FORWARD && turn.speed == 0.0f && near(turn.steering, 0.7f) &&
            near(sat.speed, 1.0f) && near(sat.steering, -1.0f) &&
            nan.direction == msg::Direction::STOP;
        std::cout << (ok ? "Map: OK\n" : "Map: FAIL\n");
        if (!ok) return 1;
    }

    std::cout << "\n[Test 1] ShouldSend: first, delta, direction, resend\n";
    {
        station::CommandFilterConfig cfg{};
        cfg.min_delta = 0.05f;
        cfg.resend_ms = 50;
        CommandFilter f(cfg);

        const auto a = f.Map(sample(0.5f, 0.0f));
        if (!f.ShouldSend(a, 0)) {
            std::cout << "first: FAIL\n";
            return 1;
        }
        f.MarkSent(a, 1000);

        const auto small = f.Map(sample(0.52f, 0.0f));
        const auto big   = f.Map(sample(0.7f, 0.0f));
        const auto steer = f.Map(sample(0.5f, 0.3f));
        const auto rev   = f.Map(sample(-0.5f, 0.0f));

        if (f.ShouldSend(small, 2000) ||          // 1 ms later, tiny change
            !f.ShouldSend(big, 2000) ||
            !f.ShouldSend(steer, 2000) ||
            !f.ShouldSend(rev, 2000) ||
            !f.ShouldSend(small, 1000 + 50 * 1000)) {   // resend period elapsed
            std::cout << "ShouldSend: FAIL\n";
            return 1;
        }
        std::cout << "ShouldSend: OK\n";
    }

    std::cout << "\n[Test 2] ToMessage: stop vs move\n";
    {
        const msg::Message s = CommandFilter::ToMessage(msg::MotionCommand::Zero());
        msg::MotionCommand c{};
        c.direction = msg::Direction::BACKWARD;
        c.speed = 0.3f;
        c.steering = -0.5f;
        const msg::Message m = CommandFilter::ToMessage(c);

        if (s.type != msg::CmdType::STOP || s.cmd != "stop" ||
            m.type != msg::CmdType::MOVE || m.body.value("direction", "") != "backward" ||
            !near(m.body.value("speed", 0.0f), 0.3f) || !near(m.body.value("steering", 0.0f), -0.5f)) {
            std::cout << "ToMessage: FAIL\n";
            return 1;
        }
        std::cout << "ToMessage: OK\n";
    }

    std::cout << "\n[Test 3] KeyboardInput key handling\n";
    {
        platform::KeyboardInput kb;
        kb.HandleKey('w');
        kb.HandleKey('w');
        kb.HandleKey('w');
        kb.HandleKey('d');
        auto s = kb.Current();
        if (!near(s.throttle, 0.3f) || !near(s.steering, 0.1f) || s.quit) {
            std::cout << "keys: FAIL throttle=" << s.throttle << "\n";
            return 1;
        }
        for (int i = 0; i < 20; ++i) kb.HandleKey('s');
        kb.HandleKey('x');   // ignored
        s = kb.Current();
        if (!near(s.throttle, -1.0f)) {
            std::cout << "keys clamp: FAIL\n";
            return 1;
        }
        kb.HandleKey(' ');
        kb.HandleKey('q');
        s = kb.Current();
        if (s.throttle != 0.0f || s.steering != 0.0f || !s.quit) {
            std::cout << "keys neutral/quit: FAIL\n";
            return 1;
        }

        // Poll without a raw terminal reports the device as gone.
        platform::InputSample out{};
        if (kb.Poll(out)) {
            std::cout << "poll unopened: FAIL\n";
            return 1;
        }
        std::cout << "keys: OK\n";
    }

    std::cout << "\n[Test 4] JoystickInput: EOF and torn events are short reads\n";
    {
        char path[] = "/tmp/roverlink_js_XXXXXX";
        const int fd = ::mkstemp(path);
        if (fd < 0) {
            std::cout << "mkstemp: FAIL\n";
            return 1;
        }
        ::close(fd);

        platform::JoystickConfig jcfg{};
        jcfg.dev = path;
        platform::JoystickInput js(jcfg);
        platform::InputSample out{};

        // Empty file: read() returns 0. A stale errno must not be reported.
        errno = EAGAIN;
        if (!js.Open() || js.Poll(out) ||
            js.lastStatus() != platform::JoystickInput::Status::SHORT_READ || js.lastErrno() != 0) {
            std::cout << "eof: FAIL status=" << platform::JoystickInput::StatusStr(js.lastStatus()) << "\n";
            ::unlink(path);
            return 1;
        }

        // Three bytes of an eight byte js_event.
        {
            std::ofstream f(path, std::ios::binary);
            f.write("\x01\x02\x03", 3);
        }
        if (!js.Open() || js.Poll(out) ||
            js.lastStatus() != platform::JoystickInput::Status::SHORT_READ) {
            std::cout << "torn event: FAIL status=" << platform::JoystickInput::StatusStr(js.lastStatus()) << "\n";
            ::unlink(path);
            return 1;
        }

        // Closed after the fault.
        if (js.Poll(out) || js.lastStatus() != platform::JoystickInput::Status::NOT_OPEN) {
            std::cout << "closed after fault: FAIL\n";
            ::unlink(path);
            return 1;
        }
        ::unlink(path);
        std::cout << "joystick: OK\n";
    }

    std::cout << "\n[Main] Test complete.\n";
    return 0;
}
