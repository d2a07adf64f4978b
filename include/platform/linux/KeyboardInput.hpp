#pragma once
#include <termios.h>

#include "platform/IInputSource.hpp"

namespace platform {

// Raw terminal teleoperation on stdin.
//   w / s   : throttle +/- one step
//   a / d   : steering left / right one step
//   space   : neutral
//   q       : quit
class KeyboardInput : public IInputSource {
public:
    static constexpr float STEP = 0.1f;

    KeyboardInput() = default;
    ~KeyboardInput() override;

    bool Open() override;
    bool Poll(InputSample& out) override;
    void Close() override;
    const char* Name() const override { return "keyboard"; }

    // Applies one key to the current state. Exposed for tests.
    void HandleKey(char c);
    InputSample Current() const {
        InputSample s;
        s.throttle = m_throttle;
        s.steering = m_steering;
        s.quit     = m_quit;
        return s;
    }

private:
    bool    m_raw = false;
    termios m_saved{};

    float m_throttle = 0.0f;
    float m_steering = 0.0f;
    bool  m_quit = false;
};

} // namespace platform
