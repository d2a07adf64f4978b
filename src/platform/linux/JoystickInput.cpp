#include "platform/linux/JoystickInput.hpp"

#include <linux/joystick.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <errno.h>
#include <string.h>

#include <iostream>

namespace {

float axis_to_unit(int16_t v) {
    float f = static_cast<float>(v) / 32767.0f;
    if (f < -1.0f) f = -1.0f;
    if (f >  1.0f) f =  1.0f;
    return f;
}

} // anonymous namespace

namespace platform {

const char* JoystickInput::StatusStr(Status s) {
    switch (s) {
        case Status::OK:         return "OK";
        case Status::OPEN_FAIL:  return "OPEN_FAIL";
        case Status::READ_FAIL:  return "READ_FAIL";
        case Status::SHORT_READ: return "SHORT_READ";
        case Status::NOT_OPEN:   return "NOT_OPEN";
        default:                 return "UNKNOWN";
    }
}

JoystickInput::JoystickInput(const JoystickConfig& cfg)
: m_cfg(cfg) {}

JoystickInput::~JoystickInput() {
    Close();
}

bool JoystickInput::Open() {
    Close();
    m_status = Status::OK;
    m_errno  = 0;
    m_fd = ::open(m_cfg.dev.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (m_fd < 0) {
        m_status = Status::OPEN_FAIL;
        m_errno  = errno;
        std::cerr << "[INPUT] cannot open " << m_cfg.dev
                  << " errno=" << errno << " (" << ::strerror(errno) << ")\n";
        return false;
    }

    char name[128] = {0};
    if (::ioctl(m_fd, JSIOCGNAME(sizeof(name)), name) < 0) {
        ::strncpy(name, "unknown", sizeof(name) - 1);
    }
    uint8_t axes = 0;
    uint8_t buttons = 0;
    (void)::ioctl(m_fd, JSIOCGAXES, &axes);
    (void)::ioctl(m_fd, JSIOCGBUTTONS, &buttons);

    std::cout << "[INPUT] joystick " << name << " axes=" << int(axes)
              << " buttons=" << int(buttons) << "\n";

    m_throttle = 0.0f;
    m_steering = 0.0f;
    m_quit = false;
    return true;
}

bool JoystickInput::Poll(InputSample& out) {
    if (m_fd < 0) {
        m_status = Status::NOT_OPEN;
        return false;
    }

    js_event ev{};
    while (true) {
        const ssize_t r = ::read(m_fd, &ev, sizeof(ev));
        if (r == static_cast<ssize_t>(sizeof(ev))) {
            const uint8_t type = ev.type & ~JS_EVENT_INIT;
            if (type == JS_EVENT_AXIS) {
                if (ev.number == m_cfg.throttle_axis) m_throttle = -axis_to_unit(ev.value);
                else if (ev.number == m_cfg.steering_axis) m_steering = axis_to_unit(ev.value);
            } else if (type == JS_EVENT_BUTTON) {
                if (ev.number == m_cfg.quit_button && ev.value) m_quit = true;
            }
            continue;
        }
        if (r < 0 && errno == EINTR) continue;
        if (r < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;

        if (r >= 0) {
            // EOF or a torn event: the device is not delivering js_events
            m_status = Status::SHORT_READ;
            m_errno  = 0;
            std::cerr << "[INPUT] joystick short read (" << r << " of "
                      << sizeof(ev) << " bytes)\n";
        } else {
            // ENODEV: pad unplugged
            m_status = Status::READ_FAIL;
            m_errno  = errno;
            std::cerr << "[INPUT] joystick read failed errno=" << m_errno
                      << " (" << ::strerror(m_errno) << ")\n";
        }
        Close();
        return false;
    }

    out.throttle = m_throttle;
    out.steering = m_steering;
    out.quit     = m_quit;
    return true;
}

void JoystickInput::Close() {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

} // namespace platform
