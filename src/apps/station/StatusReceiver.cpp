#include "apps/station/StatusReceiver.hpp"
#include "apps/ctrl/FrameCodec.hpp"

#include <cmath>
#include <cstring>
#include <iomanip>
#include <iostream>

namespace {

double bounded(const nlohmann::json& v, double lim) {
    const double d = v.get<double>();
    if (std::isnan(d)) return 0.0;
    if (d > lim)  return lim;
    if (d < -lim) return -lim;
    return d;
}

} // anonymous namespace

namespace station {

StatusReceiver::StatusReceiver(OperatorLink& link, core::ShutdownCoordinator* shutdown)
: m_link(link)
, m_shutdown(shutdown) {}

void StatusReceiver::TaskEntry(void* arg) {
    auto* ctx = static_cast<TaskCtx*>(arg);

    // Minimal defensive checks.
    if (!ctx || !ctx->self) {
        return;
    }
    ctx->self->Run(ctx->status_out);
}

bool StatusReceiver::ParseStatusReport(const msg::Message& m, msg::StatusReport& out) {
    if (m.type != msg::CmdType::STATUS_REPORT || !m.body.is_object()) return false;

    out = msg::StatusReport{};
    auto b = m.body.find("battery");
    if (b != m.body.end() && b->is_number()) out.battery = static_cast<int>(bounded(*b, 1e6));
    auto s = m.body.find("speed");
    if (s != m.body.end() && s->is_number()) out.speed = static_cast<float>(bounded(*s, 1e6));
    auto t = m.body.find("steering");
    if (t != m.body.end() && t->is_number()) out.steering = static_cast<float>(bounded(*t, 1e6));
    out.rx_us = Rtos::NowUs();
    return true;
}

void StatusReceiver::handle(const msg::Message& m, StatusQueue* status_out) {
    switch (m.type) {
        case msg::CmdType::STATUS_REPORT: {
            msg::StatusReport r{};
            if (!ParseStatusReport(m, r)) return;
            m_reports.fetch_add(1);
            if (status_out) status_out->send(r);
            std::cout << "[STATUS] battery=" << r.battery << "%"
                      << std::fixed << std::setprecision(2)
                      << " speed=" << r.speed << " steering=" << r.steering
                      << std::defaultfloat << "\n";
            return;
        }
        case msg::CmdType::ERROR: {
            std::string reason = "unspecified";
            auto it = m.body.find("reason");
            if (it != m.body.end() && it->is_string()) reason = it->get<std::string>();
            std::cerr << "[STATUS] vehicle reported error: " << reason << "\n";
            return;
        }
        default:
            std::cerr << "[STATUS] ignoring '" << m.cmd << "' from vehicle\n";
            return;
    }
}

void StatusReceiver::Run(StatusQueue* status_out) {
    std::string rx;
    uint8_t buf[4096];

    while (true) {
        std::size_t n = 0;
        if (!m_link.Recv(buf, sizeof(buf), n)) {
            const net::SocketStatus st = m_link.lastRecvStatus();
            if (StopRequested() || st == net::SocketStatus::CLOSED_BY_US) {
                break;
            }
            if (st == net::SocketStatus::PEER_CLOSED) {
                std::cout << "[STATUS] vehicle closed the connection\n";
            } else {
                std::cerr << "[STATUS] read failed status=" << net::SocketStatusStr(st)
                          << " errno=" << m_link.lastRecvErrno()
                          << " (" << std::strerror(m_link.lastRecvErrno()) << ")\n";
            }
            if (m_shutdown) m_shutdown->RequestShutdown("vehicle disconnected");
            break;
        }
        rx.append(reinterpret_cast<const char*>(buf), n);

        while (true) {
            msg::Message m;
            const ctrl::DecodeStatus ds = ctrl::FrameCodec::Decode(rx, m);
            if (ds == ctrl::DecodeStatus::INCOMPLETE) break;
            if (ds == ctrl::DecodeStatus::FRAME_ERROR) {
                std::cerr << "[STATUS] " << ctrl::DecodeStatusStr(ds) << ", frame skipped\n";
                continue;
            }
            handle(m, status_out);
        }
    }
    std::cout << "[STATUS] exiting, reports=" << m_reports.load() << "\n";
}

} // namespace station
