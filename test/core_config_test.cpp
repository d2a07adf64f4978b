// Command-line parsing and config sanitising for both executables.

#include <iostream>
#include <string>
#include <vector>

#include "apps/core/Config.hpp"

// argv storage that outlives the parse call.
struct Args {
    std::vector<std::string> store;
    std::vector<char*> ptrs;

    Args(std::initializer_list<const char*> list) {
        for (const char* s : list) store.emplace_back(s);
        for (auto& s : store) ptrs.push_back(&s[0]);
        ptrs.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(store.size()); }
    char** argv() { return ptrs.data(); }
};

int main() {
    std::cout << "=== core_config_test ===\n";

    std::cout << "\n[Test 0] vehicle defaults and flags\n";
    {
        core::VehicleConfig c{};
        Args none{"roverlink_vehicle"};
        if (core::ParseVehicleArgs(none.argc(), none.argv(), c) != core::ParseResult::OK ||
            c.port != 5051 || c.fps != 20 || c.camera != 0 || c.actuator != platform::ActuatorKind::SIM) {
            std::cout << "defaults: FAIL\n";
            return 1;
        }

        Args a{"roverlink_vehicle", "--host", "127.0.0.1", "--port", "7000",
               "--fps", "30", "--camera", "2", "--actuator", "l298n"};
        core::VehicleConfig v{};
        if (core::ParseVehicleArgs(a.argc(), a.argv(), v) != core::ParseResult::OK) {
            std::cout << "flags: FAIL\n";
            return 1;
        }
        v = core::sanitise(v);
        if (v.host != "127.0.0.1" || v.port != 7000 || v.fps != 30 || v.camera != 2 ||
            v.actuator != platform::ActuatorKind::L298N) {
            std::cout << "flags values: FAIL\n";
            return 1;
        }
        std::cout << "vehicle flags: OK\n";
    }

    std::cout << "\n[Test 1] vehicle out-of-range values fall back\n";
    {
        Args a{"roverlink_vehicle", "--port", "70000", "--fps", "500", "--camera", "-3"};
        core::VehicleConfig v{};
        if (core::ParseVehicleArgs(a.argc(), a.argv(), v) != core::ParseResult::OK) {
            std::cout << "parse: FAIL\n";
            return 1;
        }
        v = core::sanitise(v);
        if (v.port != 5051 || v.fps != 60 || v.camera != 0) {
            std::cout << "fallback: FAIL port=" << v.port << " fps=" << v.fps << "\n";
            return 1;
        }

        core::VehicleConfig z{};
        z.fps = 0;
        z.jpeg_quality = 400;
        z.backlog = 0;
        z.host.clear();
        z = core::sanitise(z);
        if (z.fps != 1 || z.jpeg_quality != 100 || z.backlog != 1 || z.host != "0.0.0.0") {
            std::cout << "sanitise: FAIL\n";
            return 1;
        }
        std::cout << "vehicle fallback: OK\n";
    }

    std::cout << "\n[Test 2] vehicle help and errors\n";
    {
        core::VehicleConfig v{};
        Args help{"roverlink_vehicle", "--help"};
        Args unknown{"roverlink_vehicle", "--colour", "red"};
        Args missing{"roverlink_vehicle", "--port"};
        Args bad{"roverlink_vehicle", "--fps", "fast"};
        Args kind{"roverlink_vehicle", "--actuator", "servo"};
        if (core::ParseVehicleArgs(help.argc(), help.argv(), v) != core::ParseResult::HELP ||
            core::ParseVehicleArgs(unknown.argc(), unknown.argv(), v) != core::ParseResult::ERROR ||
            core::ParseVehicleArgs(missing.argc(), missing.argv(), v) != core::ParseResult::ERROR ||
            core::ParseVehicleArgs(bad.argc(), bad.argv(), v) != core::ParseResult::ERROR ||
            core::ParseVehicleArgs(kind.argc(), kind.argv(), v) != core::ParseResult::ERROR) {
            std::cout << "vehicle errors: FAIL\n";
            return 1;
        }
        std::cout << "vehicle errors: OK\n";
    }

    std::cout << "\n[Test 3] operator: server_ip required, flags parsed\n";
    {
        core::OperatorConfig o{};
        Args none{"roverlink_operator", "--input", "keyboard"};
        if (core::ParseOperatorArgs(none.argc(), none.argv(), o) != core::ParseResult::ERROR) {
            std::cout << "server_ip required: FAIL\n";
            return 1;
        }

        core::OperatorConfig p{};
        Args a{"roverlink_operator", "--server_ip", "192.168.1.20", "--server_port", "5052",
               "--video_port", "6100", "--input", "none", "--status_ms", "250", "--no_quit"};
        if (core::ParseOperatorArgs(a.argc(), a.argv(), p) != core::ParseResult::OK) {
            std::cout << "operator flags: FAIL\n";
            return 1;
        }
        p = core::sanitise(p);
        if (p.server_ip != "192.168.1.20" || p.server_port != 5052 || p.video_port != 6100 ||
            p.input != core::InputKind::NONE || p.status_ms != 250 || p.send_quit_on_exit) {
            std::cout << "operator values: FAIL\n";
            return 1;
        }
        std::cout << "operator flags: OK\n";
    }

    std::cout << "\n[Test 4] operator fallbacks and errors\n";
    {
        core::OperatorConfig o{};
        Args a{"roverlink_operator", "--server_ip", "10.0.0.2", "--video_port", "0",
               "--server_port", "99999", "--status_ms", "999999"};
        if (core::ParseOperatorArgs(a.argc(), a.argv(), o) != core::ParseResult::OK) {
            std::cout << "parse: FAIL\n";
            return 1;
        }
        o = core::sanitise(o);
        if (o.video_port != 6000 || o.server_port != 5051 || o.status_ms != core::MAX_STATUS_MS ||
            o.input != core::InputKind::JOYSTICK || !o.send_quit_on_exit) {
            std::cout << "operator fallback: FAIL\n";
            return 1;
        }

        core::OperatorConfig e{};
        Args badin{"roverlink_operator", "--server_ip", "10.0.0.2", "--input", "wheel"};
        Args help{"roverlink_operator", "-h"};
        if (core::ParseOperatorArgs(badin.argc(), badin.argv(), e) != core::ParseResult::ERROR ||
            core::ParseOperatorArgs(help.argc(), help.argv(), e) != core::ParseResult::HELP) {
            std::cout << "operator errors: FAIL\n";
            return 1;
        }
        if (std::string(core::InputKindStr(core::InputKind::KEYBOARD)) != "keyboard") {
            std::cout << "InputKindStr: FAIL\n";
            return 1;
        }
        std::cout << "operator fallback: OK\n";
    }

    std::cout << "\n[Main] Test complete.\n";
    return 0;
}
