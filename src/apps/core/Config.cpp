#include "apps/core/Config.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>

namespace {

bool parse_long(const char* s, long& out) {
    if (!s || !*s) return false;
    errno = 0;
    char* end = nullptr;
    const long v = std::strtol(s, &end, 10);
    if (errno != 0 || !end || *end != '\0') return false;
    out = v;
    return true;
}

bool valid_port(int p) { return p > 0 && p <= 65535; }

// Out-of-range values become -1 so sanitise() restores the default.
int port_or_invalid(long v) { return (v > 0 && v <= 65535) ? static_cast<int>(v) : -1; }

// Returns argv[i+1] and advances i, or nullptr if the flag has no value.
const char* take_value(int argc, char** argv, int& i) {
    if (i + 1 >= argc) {
        std::cerr << "missing value for " << argv[i] << "\n";
        return nullptr;
    }
    return argv[++i];
}

} // anonymous namespace

namespace core {

const char* InputKindStr(InputKind k) {
    switch (k) {
        case InputKind::JOYSTICK: return "joystick";
        case InputKind::KEYBOARD: return "keyboard";
        case InputKind::NONE:     return "none";
        default:                  return "unknown";
    }
}

VehicleConfig sanitise(const VehicleConfig& in) {
    VehicleConfig cfg = in;

    if (cfg.host.empty()) cfg.host = "0.0.0.0";
    if (!valid_port(cfg.port)) cfg.port = DEFAULT_COMMAND_PORT;
    if (cfg.backlog < 1) cfg.backlog = 1;

    if (cfg.fps < 1) cfg.fps = 1;
    if (cfg.fps > MAX_FPS) cfg.fps = MAX_FPS;
    if (cfg.camera < 0) cfg.camera = 0;
    if (cfg.idle_backoff_ms == 0) cfg.idle_backoff_ms = 500;

    if (cfg.out_width <= 0)  cfg.out_width  = 320;
    if (cfg.out_height <= 0) cfg.out_height = 240;
    if (cfg.jpeg_quality < 1)   cfg.jpeg_quality = 1;
    if (cfg.jpeg_quality > 100) cfg.jpeg_quality = 100;

    if (cfg.join_timeout_ms == 0) cfg.join_timeout_ms = 2000;
    return cfg;
}

OperatorConfig sanitise(const OperatorConfig& in) {
    OperatorConfig cfg = in;

    if (!valid_port(cfg.server_port)) cfg.server_port = DEFAULT_COMMAND_PORT;
    if (!valid_port(cfg.video_port))  cfg.video_port  = DEFAULT_VIDEO_PORT;
    if (cfg.joystick_dev.empty()) cfg.joystick_dev = "/dev/input/js0";
    if (cfg.status_ms > MAX_STATUS_MS) cfg.status_ms = MAX_STATUS_MS;
    if (cfg.join_timeout_ms == 0) cfg.join_timeout_ms = 1000;
    return cfg;
}

void PrintVehicleUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  --host <addr>       command channel bind address (default 0.0.0.0)\n"
              << "  --port <n>          command channel TCP port (default " << DEFAULT_COMMAND_PORT << ")\n"
              << "  --fps <n>           media frame rate, 1.." << MAX_FPS << " (default " << DEFAULT_FPS << ")\n"
              << "  --camera <n>        capture device index (default 0)\n"
              << "  --actuator <kind>   sim | l298n (default sim)\n"
              << "  --help              show this message\n";
}

void PrintOperatorUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " --server_ip <addr> [options]\n"
              << "  --server_ip <addr>    vehicle address (required)\n"
              << "  --server_port <n>     vehicle command port (default " << DEFAULT_COMMAND_PORT << ")\n"
              << "  --video_port <n>      local UDP port for media (default " << DEFAULT_VIDEO_PORT << ")\n"
              << "  --input <kind>        joystick | keyboard | none (default joystick)\n"
              << "  --joystick <dev>      joystick device node (default /dev/input/js0)\n"
              << "  --status_ms <n>       status poll period, 0 disables (default 1000)\n"
              << "  --no_quit             do not send quit to the vehicle on exit\n"
              << "  --help                show this message\n";
}

ParseResult ParseVehicleArgs(int argc, char** argv, VehicleConfig& out) {
    const char* argv0 = argc > 0 ? argv[0] : "roverlink_vehicle";

    int i = 1;
    for (; i < argc; ++i) {
        const std::string arg = argv[i];
        const char* val = nullptr;
        long v = 0;

        if (arg == "--help" || arg == "-h") {
            PrintVehicleUsage(argv0);
            return ParseResult::HELP;
        }

        if (arg == "--host") {
            if (!(val = take_value(argc, argv, i))) break;
            out.host = val;
        } else if (arg == "--port") {
            if (!(val = take_value(argc, argv, i))) break;
            if (!parse_long(val, v)) { std::cerr << "bad --port " << val << "\n"; break; }
            out.port = port_or_invalid(v);
        } else if (arg == "--fps") {
            if (!(val = take_value(argc, argv, i))) break;
            if (!parse_long(val, v) || v < 0) { std::cerr << "bad --fps " << val << "\n"; break; }
            out.fps = v > long(MAX_FPS) ? MAX_FPS : static_cast<uint32_t>(v);
        } else if (arg == "--camera") {
            if (!(val = take_value(argc, argv, i))) break;
            if (!parse_long(val, v)) { std::cerr << "bad --camera " << val << "\n"; break; }
            out.camera = (v < 0 || v > 255) ? -1 : static_cast<int>(v);
        } else if (arg == "--actuator") {
            if (!(val = take_value(argc, argv, i))) break;
            if (!platform::ParseActuatorKind(val, out.actuator)) {
                std::cerr << "bad --actuator " << val << " (expected sim or l298n)\n";
                break;
            }
        } else {
            std::cerr << "unknown option " << arg << "\n";
            break;
        }
    }

    // The loop only exits early on a bad flag or value.
    if (i < argc) {
        PrintVehicleUsage(argv0);
        return ParseResult::ERROR;
    }
    return ParseResult::OK;
}

ParseResult ParseOperatorArgs(int argc, char** argv, OperatorConfig& out) {
    const char* argv0 = argc > 0 ? argv[0] : "roverlink_operator";

    int i = 1;
    for (; i < argc; ++i) {
        const std::string arg = argv[i];
        const char* val = nullptr;
        long v = 0;

        if (arg == "--help" || arg == "-h") {
            PrintOperatorUsage(argv0);
            return ParseResult::HELP;
        }

        if (arg == "--server_ip") {
            if (!(val = take_value(argc, argv, i))) break;
            out.server_ip = val;
        } else if (arg == "--server_port") {
            if (!(val = take_value(argc, argv, i))) break;
            if (!parse_long(val, v)) { std::cerr << "bad --server_port " << val << "\n"; break; }
            out.server_port = port_or_invalid(v);
        } else if (arg == "--video_port") {
            if (!(val = take_value(argc, argv, i))) break;
            if (!parse_long(val, v)) { std::cerr << "bad --video_port " << val << "\n"; break; }
            out.video_port = port_or_invalid(v);
        } else if (arg == "--input") {
            if (!(val = take_value(argc, argv, i))) break;
            const std::string k = val;
            if (k == "joystick")      out.input = InputKind::JOYSTICK;
            else if (k == "keyboard") out.input = InputKind::KEYBOARD;
            else if (k == "none")     out.input = InputKind::NONE;
            else { std::cerr << "bad --input " << k << " (expected joystick, keyboard or none)\n"; break; }
        } else if (arg == "--joystick") {
            if (!(val = take_value(argc, argv, i))) break;
            out.joystick_dev = val;
        } else if (arg == "--status_ms") {
            if (!(val = take_value(argc, argv, i))) break;
            if (!parse_long(val, v) || v < 0) { std::cerr << "bad --status_ms " << val << "\n"; break; }
            out.status_ms = v > long(MAX_STATUS_MS) ? MAX_STATUS_MS : static_cast<uint32_t>(v);
        } else if (arg == "--no_quit") {
            out.send_quit_on_exit = false;
        } else {
            std::cerr << "unknown option " << arg << "\n";
            break;
        }
    }

    if (i < argc) {
        PrintOperatorUsage(argv0);
        return ParseResult::ERROR;
    }
    if (out.server_ip.empty()) {
        std::cerr << "--server_ip is required\n";
        PrintOperatorUsage(argv0);
        return ParseResult::ERROR;
    }
    return ParseResult::OK;
}

} // namespace core
