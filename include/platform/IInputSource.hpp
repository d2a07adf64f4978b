#pragma once

namespace platform {

// Operator intent sampled from a local device.
// throttle in [-1, 1], positive = forward.
// steering in [-1, 1], positive = right.
struct InputSample {
    float throttle = 0.0f;
    float steering = 0.0f;
    bool  quit     = false;   // the operator asked to end the session
};

class IInputSource {
public:
    virtual ~IInputSource() = default;

    virtual bool Open() = 0;

    // Non-blocking. Drains pending device events and writes the current
    // state. False only when the device has gone away.
    virtual bool Poll(InputSample& out) = 0;

    virtual void Close() = 0;
    virtual const char* Name() const = 0;
};

} // namespace platform
