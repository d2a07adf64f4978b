#include <signal.h>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "os/rtos.hpp"
#include "net/UdpSocket.hpp"
#include "apps/core/Config.hpp"
#include "apps/core/ShutdownCoordinator.hpp"
#include "apps/ctrl/ClientTargetRegistry.hpp"
#include "apps/ctrl/CommandDispatcher.hpp"
#include "apps/ctrl/CommandServer.hpp"
#include "apps/video/FrameEncoder.hpp"
#include "apps/video/MediaRelay.hpp"
#include "platform/linux/ActuatorFactory.hpp"
#include "platform/linux/OpenCvCamera.hpp"

// Set from the signal handler, polled by the main loop.
static volatile std::sig_atomic_t g_signal = 0;

static void on_signal(int sig) {
    g_signal = sig;
}

static void install_signal_handlers() {
    struct sigaction sa{};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // A peer vanishing mid-write must not kill the process.
    std::signal(SIGPIPE, SIG_IGN);
}

// Define the RTOS task objects
Rtos::Task CommandServerTask;
Rtos::Task MediaRelayTask;

int main(int argc, char** argv) {
    core::VehicleConfig raw{};
    switch (core::ParseVehicleArgs(argc, argv, raw)) {
        case core::ParseResult::HELP:  return 0;
        case core::ParseResult::ERROR: return 2;
        default: break;
    }
    const core::VehicleConfig cfg = core::sanitise(raw);

    install_signal_handlers();

    std::cout << "[MAIN] roverlink vehicle: " << cfg.host << ":" << cfg.port
              << " fps=" << cfg.fps << " camera=" << cfg.camera
              << " actuator=" << platform::ActuatorKindStr(cfg.actuator) << "\n";

    // ---- Actuation ----
    std::unique_ptr<platform::IActuator> actuator = platform::CreateActuator(cfg.actuator);
    if (!actuator->Open()) {
        std::cerr << "[MAIN] actuator " << actuator->Name()
                  << " unavailable, motion commands will only update state\n";
    }

    // ---- Shared state ----
    ctrl::ClientTargetRegistry registry;
    core::ShutdownCoordinator  shutdown;

    // ---- Command channel ----
    ctrl::CommandDispatcher dispatcher(registry, *actuator, &shutdown);

    ctrl::CommandServerConfig server_cfg{};
    server_cfg.host    = cfg.host;
    server_cfg.port    = static_cast<uint16_t>(cfg.port);
    server_cfg.backlog = cfg.backlog;
    ctrl::CommandServer server(server_cfg, dispatcher, registry);

    if (!server.Open()) {
        actuator->Close();
        return 1;
    }

    // ---- Media channel ----
    platform::OpenCvCameraConfig cam_cfg{};
    cam_cfg.index = cfg.camera;
    platform::OpenCvCamera camera(cam_cfg);

    video::JpegEncoderConfig enc_cfg{};
    enc_cfg.width   = cfg.out_width;
    enc_cfg.height  = cfg.out_height;
    enc_cfg.quality = cfg.jpeg_quality;
    video::JpegEncoder encoder(enc_cfg);

    net::UdpSocket udp;
    if (!udp.Open()) {
        std::cerr << "[MAIN] UDP socket unavailable errno=" << udp.lastErrno()
                  << ", media sends will fail\n";
    }

    video::MediaRelayConfig relay_cfg{};
    relay_cfg.fps = cfg.fps;
    relay_cfg.idle_backoff_ms = cfg.idle_backoff_ms;
    video::MediaRelay relay(relay_cfg, registry, camera, encoder, udp);

    // ---- Shutdown wiring ----
    shutdown.AddStopHook("command server", ctrl::CommandServer::StopHook, &server);
    shutdown.AddStopHook("media relay", video::MediaRelay::StopHook, &relay);

    // ---- Tasks ----
    static ctrl::CommandServer::TaskCtx server_ctx{};
    server_ctx.self = &server;
    static video::MediaRelay::TaskCtx relay_ctx{};
    relay_ctx.self = &relay;

    if (CommandServerTask.Create("CommandServer", ctrl::CommandServer::TaskEntry, &server_ctx)) {
        shutdown.AddTask("CommandServer", &CommandServerTask);
    } else {
        shutdown.RequestShutdown("command server task failed");
    }
    if (MediaRelayTask.Create("MediaRelay", video::MediaRelay::TaskEntry, &relay_ctx)) {
        shutdown.AddTask("MediaRelay", &MediaRelayTask);
    } else {
        std::cerr << "[MAIN] media relay task failed, running without video\n";
    }

    // ---- Main loop ----
    uint32_t ticks = 0;
    while (!shutdown.WaitFor(200)) {
        if (g_signal != 0) {
            shutdown.RequestShutdown(g_signal == SIGINT ? "SIGINT" : "SIGTERM");
            break;
        }
        if (++ticks % 50 == 0) {   // ~10 s
            const msg::VehicleState st = actuator->State();
            msg::ClientTarget target{};
            const bool has_target = registry.Get(target);
            const video::RelayStats rs = relay.Stats();
            std::cout << "[MAIN] HEARTBEAT conns=" << server.ActiveConnections()
                      << " target=" << (has_target ? target.host + ":" + std::to_string(target.port) : "none")
                      << " frames=" << rs.frames_sent
                      << " speed=" << st.speed << " steering=" << st.steering << "\n";
        }
    }

    std::cout << "[MAIN] shutting down (" << shutdown.Reason() << ")\n";
    const std::size_t stuck = shutdown.JoinAll(cfg.join_timeout_ms);

    actuator->Stop();
    actuator->Close();
    udp.Close();

    if (stuck > 0) {
        // Stuck tasks still reference objects on this stack; do not unwind.
        std::cerr << "[MAIN] " << stuck << " task(s) did not exit, forcing exit\n";
        std::cout.flush();
        std::_Exit(1);
    }

    std::cout << "[MAIN] bye\n";
    return 0;
}
