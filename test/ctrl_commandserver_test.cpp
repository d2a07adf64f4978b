// Command server over loopback: registration drives the media relay,
// split writes, disconnect ownership, quit-driven shutdown.

#include <signal.h>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "os/rtos.hpp"
#include "net/TcpSocket.hpp"
#include "net/UdpSocket.hpp"
#include "apps/core/ShutdownCoordinator.hpp"
#include "apps/ctrl/ClientTargetRegistry.hpp"
#include "apps/ctrl/CommandDispatcher.hpp"
#include "apps/ctrl/CommandServer.hpp"
#include "apps/ctrl/FrameCodec.hpp"
#include "apps/video/MediaRelay.hpp"
#include "platform/linux/SimActuator.hpp"

class StillCamera : public platform::ICameraSource {
public:
    bool Open() override { m_open = true; return true; }
    bool Grab(cv::Mat& out) override {
        out = cv::Mat(8, 8, CV_8UC3, cv::Scalar(10, 20, 30));
        return true;
    }
    void Release() override { m_open = false; }
    bool IsOpen() const override { return m_open; }
private:
    bool m_open = false;
};

// Fixed payload so the receiver can recognise relay output.
class MarkerEncoder : public video::IFrameEncoder {
public:
    bool Encode(const cv::Mat&, std::vector<uint8_t>& out) override {
        out.assign({0xFF, 0xD8, 'R', 'L', 0xFF, 0xD9});
        return true;
    }
};

static bool connectClient(net::TcpStream& s, uint16_t port) {
    if (!s.Connect("127.0.0.1", port)) return false;
    return s.SetRecvTimeoutMs(2000);
}

static bool send(net::TcpStream& s, const std::string& bytes) {
    return s.SendAll(bytes);
}

// Next decoded frame from the stream, or false on timeout/close.
static bool readMessage(net::TcpStream& s, std::string& rx, msg::Message& out) {
    uint8_t buf[1024];
    while (true) {
        if (ctrl::FrameCodec::Decode(rx, out) == ctrl::DecodeStatus::OK) return true;
        std::size_t n = 0;
        if (!s.Recv(buf, sizeof(buf), n)) return false;
        rx.append(reinterpret_cast<const char*>(buf), n);
    }
}

static bool waitTarget(const ctrl::ClientTargetRegistry& reg, bool want, uint32_t timeout_ms,
                       msg::ClientTarget* out = nullptr) {
    const uint64_t deadline = Rtos::NowUs() + uint64_t(timeout_ms) * 1000ull;
    while (Rtos::NowUs() < deadline) {
        msg::ClientTarget t{};
        const bool has = reg.Get(t);
        if (has == want) {
            if (out) *out = t;
            return true;
        }
        Rtos::SleepMs(10);
    }
    return false;
}

Rtos::Task ServerTask;
Rtos::Task RelayTask;

int main() {
    std::cout << "=== ctrl_commandserver_test ===\n";
    std::signal(SIGPIPE, SIG_IGN);

    ctrl::ClientTargetRegistry registry;
    platform::SimActuator actuator;
    actuator.Open();
    core::ShutdownCoordinator shutdown;
    ctrl::CommandDispatcher dispatcher(registry, actuator, &shutdown);

    ctrl::CommandServerConfig scfg{};
    scfg.host = "127.0.0.1";
    scfg.port = 0;
    ctrl::CommandServer server(scfg, dispatcher, registry);
    if (!server.Open()) {
        std::cout << "server open: FAIL\n";
        return 1;
    }
    const uint16_t port = server.BoundPort();

    net::UdpSocket video_rx;
    if (!video_rx.Bind(0) || !video_rx.SetRecvTimeoutMs(2000)) {
        std::cout << "udp bind: FAIL\n";
        return 1;
    }
    net::UdpSocket video_tx;
    video_tx.Open();

    StillCamera camera;
    MarkerEncoder encoder;
    video::MediaRelayConfig rcfg{};
    rcfg.fps = 30;
    rcfg.idle_backoff_ms = 50;
    video::MediaRelay relay(rcfg, registry, camera, encoder, video_tx);

    shutdown.AddStopHook("command server", ctrl::CommandServer::StopHook, &server);
    shutdown.AddStopHook("media relay", video::MediaRelay::StopHook, &relay);

    static ctrl::CommandServer::TaskCtx sctx{};
    sctx.self = &server;
    static video::MediaRelay::TaskCtx rctx{};
    rctx.self = &relay;
    if (!ServerTask.Create("CommandServer", ctrl::CommandServer::TaskEntry, &sctx) ||
        !RelayTask.Create("MediaRelay", video::MediaRelay::TaskEntry, &rctx)) {
        std::cout << "task create: FAIL\n";
        return 1;
    }
    shutdown.AddTask("CommandServer", &ServerTask);
    shutdown.AddTask("MediaRelay", &RelayTask);

    net::TcpStream a;
    std::string a_rx;

    std::cout << "\n[Test 0] no target, relay idles\n";
    {
        Rtos::SleepMs(150);
        if (relay.Stats().frames_sent != 0 || relay.Stats().idle_waits == 0) {
            std::cout << "idle: FAIL\n";
            return 1;
        }
        std::cout << "idle: OK\n";
    }

    std::cout << "\n[Test 1] register_video redirects the relay to the peer\n";
    {
        if (!connectClient(a, port)) {
            std::cout << "connect: FAIL\n";
            return 1;
        }
        send(a, "{\"cmd\":\"register_video\",\"video_port\":" +
                std::to_string(video_rx.BoundPort()) + "}\n");

        msg::ClientTarget t{};
        if (!waitTarget(registry, true, 2000, &t) || t.host != "127.0.0.1" ||
            t.port != video_rx.BoundPort()) {
            std::cout << "register: FAIL\n";
            return 1;
        }

        uint8_t dgram[64];
        std::size_t n = 0;
        if (!video_rx.RecvFrom(dgram, sizeof(dgram), n) || n != 6 ||
            dgram[0] != 0xFF || dgram[1] != 0xD8 || dgram[2] != 'R') {
            std::cout << "relay datagram: FAIL n=" << n << "\n";
            return 1;
        }
        std::cout << "register: OK\n";
    }

    std::cout << "\n[Test 2] frames split across writes, malformed line skipped\n";
    {
        send(a, "{\"cmd\":\"move\",\"direc");
        Rtos::SleepMs(20);
        send(a, "tion\":\"forward\",\"speed\":0.5,\"steering\":0.25}\nnot json\n{\"cmd\":\"sta");
        Rtos::SleepMs(20);
        send(a, "tus\"}\n");

        msg::Message reply;
        if (!readMessage(a, a_rx, reply) || reply.type != msg::CmdType::STATUS_REPORT ||
            reply.body.value("speed", 0.0f) != 0.5f || reply.body.value("steering", 0.0f) != 0.25f ||
            reply.body.value("battery", 0) != 100) {
            std::cout << "split/status: FAIL\n";
            return 1;
        }
        std::cout << "split/status: OK\n";
    }

    std::cout << "\n[Test 3] another connection closing keeps A's target\n";
    {
        net::TcpStream b;
        if (!connectClient(b, port)) {
            std::cout << "connect B: FAIL\n";
            return 1;
        }
        send(b, "{\"cmd\":\"status\"}\n");
        std::string b_rx;
        msg::Message reply;
        if (!readMessage(b, b_rx, reply)) {
            std::cout << "B status: FAIL\n";
            return 1;
        }
        b.Close();
        Rtos::SleepMs(200);
        msg::ClientTarget t{};
        if (!registry.Get(t) || t.port != video_rx.BoundPort()) {
            std::cout << "foreign close: FAIL\n";
            return 1;
        }
        std::cout << "foreign close: OK\n";
    }

    std::cout << "\n[Test 4] owner disconnect clears the target\n";
    {
        a.Close();
        if (!waitTarget(registry, false, 2000)) {
            std::cout << "owner close: FAIL\n";
            return 1;
        }
        const uint32_t sent = relay.Stats().frames_sent;
        Rtos::SleepMs(200);
        // at most one frame in flight when the target went away
        if (relay.Stats().frames_sent > sent + 1) {
            std::cout << "relay kept sending: FAIL\n";
            return 1;
        }
        std::cout << "owner close: OK\n";
    }

    std::cout << "\n[Test 5] quit stops accept and relay within a bounded time\n";
    {
        net::TcpStream c;
        net::TcpStream idle;   // left open; the server must shut it down
        if (!connectClient(c, port) || !connectClient(idle, port)) {
            std::cout << "connect C: FAIL\n";
            return 1;
        }
        Rtos::SleepMs(50);
        const uint64_t t0 = Rtos::NowUs();
        send(c, "{\"cmd\":\"quit\"}\n");

        if (!shutdown.WaitFor(2000)) {
            std::cout << "quit shutdown: FAIL\n";
            return 1;
        }
        const std::size_t stuck = shutdown.JoinAll(3000);
        const uint64_t dt_ms = (Rtos::NowUs() - t0) / 1000ull;
        if (stuck != 0 || relay.Running() || camera.IsOpen()) {
            std::cout << "quit join: FAIL stuck=" << stuck << "\n";
            return 1;
        }

        net::TcpStream late;
        if (late.Connect("127.0.0.1", port)) {
            std::cout << "listener still open: FAIL\n";
            return 1;
        }
        const msg::VehicleState s = actuator.State();
        if (s.speed != 0.0f || s.direction != msg::Direction::STOP) {
            std::cout << "motors not stopped: FAIL\n";
            return 1;
        }
        std::cout << "quit: OK in " << dt_ms << " ms, accepted=" << server.AcceptedTotal() << "\n";
    }

    std::cout << "\n[Test 6] connection states have log names\n";
    {
        using ctrl::ConnState;
        if (std::string(ctrl::ConnStateStr(ConnState::ACCEPTED)) != "ACCEPTED" ||
            std::string(ctrl::ConnStateStr(ConnState::READING)) != "READING" ||
            std::string(ctrl::ConnStateStr(ConnState::DISPATCHING)) != "DISPATCHING" ||
            std::string(ctrl::ConnStateStr(ConnState::CLOSED)) != "CLOSED") {
            std::cout << "state names: FAIL\n";
            return 1;
        }
        std::cout << "state names: OK\n";
    }

    actuator.Close();
    std::cout << "\n[Main] Test complete.\n";
    return 0;
}
