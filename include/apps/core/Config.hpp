#pragma once
#include <cstdint>
#include <string>

#include "platform/IActuator.hpp"

namespace core {

static constexpr int      DEFAULT_COMMAND_PORT = 5051;
static constexpr int      DEFAULT_VIDEO_PORT   = 6000;
static constexpr uint32_t DEFAULT_FPS          = 20;
static constexpr uint32_t MAX_FPS              = 60;
static constexpr uint32_t MAX_STATUS_MS        = 60000;

// ------------------------------
// Vehicle (robot side)
// ------------------------------
struct VehicleConfig {
    // Command channel
    std::string host = "0.0.0.0";
    int         port = DEFAULT_COMMAND_PORT;
    int         backlog = 4;

    // Media
    uint32_t fps    = DEFAULT_FPS;
    int      camera = 0;
    uint32_t idle_backoff_ms = 500;   // no target registered
    int      out_width  = 320;
    int      out_height = 240;
    int      jpeg_quality = 50;

    platform::ActuatorKind actuator = platform::ActuatorKind::SIM;

    // Per-task bound while joining at shutdown
    uint32_t join_timeout_ms = 2000;
};

// ------------------------------
// Operator station
// ------------------------------
enum class InputKind : uint8_t {
    JOYSTICK = 0,
    KEYBOARD,
    NONE,
};

const char* InputKindStr(InputKind k);

struct OperatorConfig {
    std::string server_ip;                         // required
    int         server_port = DEFAULT_COMMAND_PORT;
    int         video_port  = DEFAULT_VIDEO_PORT;

    InputKind   input = InputKind::JOYSTICK;
    std::string joystick_dev = "/dev/input/js0";

    uint32_t status_ms = 1000;   // 0 = never poll status
    bool     send_quit_on_exit = true;

    uint32_t join_timeout_ms = 1000;
};

VehicleConfig  sanitise(const VehicleConfig& in);
OperatorConfig sanitise(const OperatorConfig& in);

enum class ParseResult : uint8_t {
    OK = 0,
    HELP,     // --help given; usage already printed
    ERROR,    // bad flag or value; message and usage already printed
};

// "--key value" flags. Values are range-checked by sanitise(), not here.
ParseResult ParseVehicleArgs(int argc, char** argv, VehicleConfig& out);
ParseResult ParseOperatorArgs(int argc, char** argv, OperatorConfig& out);

void PrintVehicleUsage(const char* argv0);
void PrintOperatorUsage(const char* argv0);

} // namespace core
