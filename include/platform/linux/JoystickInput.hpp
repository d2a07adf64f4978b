#pragma once
#include <cstdint>
#include <string>

#include "platform/IInputSource.hpp"

namespace platform {

struct JoystickConfig {
    std::string dev = "/dev/input/js0";
    uint8_t steering_axis = 0;   // left stick X
    uint8_t throttle_axis = 1;   // left stick Y, pushed up = negative raw
    uint8_t quit_button   = 9;   // start/options on most pads
};

// Linux joystick API (linux/joystick.h), non-blocking reads.
class JoystickInput : public IInputSource {
public:
    enum class Status : uint8_t {
        OK = 0,
        OPEN_FAIL,
        READ_FAIL,     // read() error (ENODEV once the pad is unplugged)
        SHORT_READ,    // EOF or a partial js_event
        NOT_OPEN
    };

    static const char* StatusStr(Status s);

    explicit JoystickInput(const JoystickConfig& cfg = {});
    ~JoystickInput() override;

    bool Open() override;
    bool Poll(InputSample& out) override;
    void Close() override;
    const char* Name() const override { return "joystick"; }

    Status lastStatus() const { return m_status; }
    int    lastErrno()  const { return m_errno; }

private:
    JoystickConfig m_cfg{};
    int m_fd = -1;

    float m_throttle = 0.0f;
    float m_steering = 0.0f;
    bool  m_quit = false;

    // FDIR
    Status m_status = Status::OK;
    int    m_errno  = 0;
};

} // namespace platform
