#include "platform/linux/KeyboardInput.hpp"

#include <unistd.h>
#include <errno.h>
#include <string.h>

#include <iostream>

namespace {

float step_clamp(float v) {
    if (v < -1.0f) return -1.0f;
    if (v >  1.0f) return  1.0f;
    // snap float drift around zero so neutral is exact
    if (v > -1e-4f && v < 1e-4f) return 0.0f;
    return v;
}

} // anonymous namespace

namespace platform {

KeyboardInput::~KeyboardInput() {
    Close();
}

bool KeyboardInput::Open() {
    if (!::isatty(STDIN_FILENO)) {
        std::cerr << "[INPUT] stdin is not a terminal, keyboard input disabled\n";
        return false;
    }
    if (::tcgetattr(STDIN_FILENO, &m_saved) != 0) {
        std::cerr << "[INPUT] tcgetattr failed errno=" << errno
                  << " (" << ::strerror(errno) << ")\n";
        return false;
    }

    termios raw = m_saved;
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN]  = 0;   // read() returns immediately
    raw.c_cc[VTIME] = 0;
    if (::tcsetattr(STDIN_FILENO, TCSANOW, &raw) != 0) {
        std::cerr << "[INPUT] tcsetattr failed errno=" << errno
                  << " (" << ::strerror(errno) << ")\n";
        return false;
    }
    m_raw = true;

    m_throttle = 0.0f;
    m_steering = 0.0f;
    m_quit = false;
    std::cout << "[INPUT] keyboard: w/s throttle, a/d steering, space neutral, q quit\n";
    return true;
}

void KeyboardInput::HandleKey(char c) {
    switch (c) {
        case 'w': case 'W': m_throttle = step_clamp(m_throttle + STEP); break;
        case 's': case 'S': m_throttle = step_clamp(m_throttle - STEP); break;
        case 'a': case 'A': m_steering = step_clamp(m_steering - STEP); break;
        case 'd': case 'D': m_steering = step_clamp(m_steering + STEP); break;
        case ' ':
            m_throttle = 0.0f;
            m_steering = 0.0f;
            break;
        case 'q': case 'Q': m_quit = true; break;
        default: break;
    }
}

bool KeyboardInput::Poll(InputSample& out) {
    if (!m_raw) return false;

    char buf[32];
    while (true) {
        const ssize_t r = ::read(STDIN_FILENO, buf, sizeof(buf));
        if (r > 0) {
            for (ssize_t i = 0; i < r; ++i) HandleKey(buf[i]);
            continue;
        }
        if (r < 0 && errno == EINTR) continue;
        break;   // 0 = nothing pending (VMIN=0)
    }

    out = Current();
    return true;
}

void KeyboardInput::Close() {
    if (m_raw) {
        ::tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
        m_raw = false;
    }
}

} // namespace platform
