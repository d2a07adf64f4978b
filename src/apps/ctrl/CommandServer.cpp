#include "apps/ctrl/CommandServer.hpp"
#include "apps/ctrl/FrameCodec.hpp"

#include <cstring>
#include <iostream>
#include <mutex>

namespace ctrl {

const char* ConnStateStr(ConnState s) {
    switch (s) {
        case ConnState::ACCEPTED:    return "ACCEPTED";
        case ConnState::READING:     return "READING";
        case ConnState::DISPATCHING: return "DISPATCHING";
        case ConnState::CLOSED:      return "CLOSED";
        default:                     return "UNKNOWN";
    }
}

CommandServer::CommandServer(const CommandServerConfig& cfg,
                             CommandDispatcher& dispatcher,
                             ClientTargetRegistry& registry)
: m_cfg(cfg)
, m_dispatcher(dispatcher)
, m_registry(registry) {
    if (m_cfg.backlog < 1) m_cfg.backlog = 1;
    if (m_cfg.conn_join_timeout_ms == 0) m_cfg.conn_join_timeout_ms = 1000;
}

CommandServer::~CommandServer() {
    m_listener.Close();
}

bool CommandServer::Open() {
    if (!m_listener.Open(m_cfg.host, m_cfg.port, m_cfg.backlog)) {
        std::cerr << "[SERVER] cannot listen on " << m_cfg.host << ":" << m_cfg.port
                  << " status=" << net::SocketStatusStr(m_listener.lastStatus())
                  << " errno=" << m_listener.lastErrno()
                  << " (" << std::strerror(m_listener.lastErrno()) << ")\n";
        return false;
    }
    std::cout << "[SERVER] listening on " << m_cfg.host << ":" << m_listener.BoundPort() << "\n";
    return true;
}

void CommandServer::RequestStop() {
    m_stop_requested.store(true);
    m_listener.RequestClose();
}

void CommandServer::StopHook(void* arg) {
    auto* self = static_cast<CommandServer*>(arg);
    if (self) self->RequestStop();
}

std::size_t CommandServer::ActiveConnections() const {
    std::lock_guard<Rtos::Mutex> lk(m_conn_lock);
    std::size_t n = 0;
    for (const auto& c : m_conns) {
        if (c->state.load() != ConnState::CLOSED) ++n;
    }
    return n;
}

void CommandServer::TaskEntry(void* arg) {
    auto* ctx = static_cast<TaskCtx*>(arg);

    // Minimal defensive checks.
    if (!ctx || !ctx->self) {
        return;
    }
    ctx->self->Run();
}

void CommandServer::Run() {
    if (!m_listener.IsOpen()) {
        std::cerr << "[SERVER] accept loop started without an open listener\n";
        return;
    }

    while (true) {
        net::TcpStream stream;
        std::string peer_host;
        uint16_t peer_port = 0;

        if (!m_listener.Accept(stream, peer_host, peer_port)) {
            if (m_listener.lastStatus() == net::SocketStatus::CLOSED_BY_US || m_stop_requested.load()) {
                std::cout << "[SERVER] listener closed, accept loop exiting\n";
                break;
            }
            std::cerr << "[SERVER] accept failed status="
                      << net::SocketStatusStr(m_listener.lastStatus())
                      << " errno=" << m_listener.lastErrno()
                      << " (" << std::strerror(m_listener.lastErrno()) << ")\n";
            reapFinished();
            Rtos::SleepMs(m_cfg.accept_retry_ms);
            continue;
        }

        reapFinished();

        auto c = std::make_unique<Connection>();
        c->server    = this;
        c->id        = ++m_next_id;
        c->peer_host = peer_host;
        c->peer_port = peer_port;
        c->stream    = std::move(stream);

        std::cout << "[SERVER] conn " << c->id << " accepted from "
                  << peer_host << ":" << peer_port << "\n";

        Connection* raw = c.get();
        {
            std::lock_guard<Rtos::Mutex> lk(m_conn_lock);
            m_conns.push_back(std::move(c));
        }

        const std::string name = "conn-" + std::to_string(raw->id);
        if (!raw->task.Create(name.c_str(), ConnectionEntry, raw)) {
            std::cerr << "[SERVER] conn " << raw->id << ": no task, dropping connection\n";
            raw->state.store(ConnState::CLOSED);
            raw->stream.Close();
            continue;
        }
        m_accepted.fetch_add(1);
    }

    closeAll();
    m_listener.Close();
    std::cout << "[SERVER] stopped\n";
}

void CommandServer::ConnectionEntry(void* arg) {
    auto* c = static_cast<Connection*>(arg);
    if (!c || !c->server) {
        return;
    }
    c->server->serveConnection(*c);
}

void CommandServer::serveConnection(Connection& c) {
    const PeerInfo peer{c.peer_host, c.id};
    uint8_t buf[RX_CHUNK];
    bool done = false;

    c.state.store(ConnState::READING);

    while (!done) {
        std::size_t n = 0;
        if (!c.stream.Recv(buf, sizeof(buf), n)) {
            const net::SocketStatus st = c.stream.lastStatus();
            if (st == net::SocketStatus::PEER_CLOSED) {
                std::cout << "[CONN] " << c.id << " peer closed\n";
            } else if (st == net::SocketStatus::CLOSED_BY_US) {
                std::cout << "[CONN] " << c.id << " closed by server\n";
            } else {
                std::cerr << "[CONN] " << c.id << " read failed status="
                          << net::SocketStatusStr(st) << " errno=" << c.stream.lastErrno()
                          << " (" << std::strerror(c.stream.lastErrno()) << ")\n";
            }
            break;
        }
        c.rx.append(reinterpret_cast<const char*>(buf), n);

        // Drain every complete frame in arrival order.
        while (!done) {
            msg::Message m;
            const DecodeStatus ds = FrameCodec::Decode(c.rx, m);
            if (ds == DecodeStatus::INCOMPLETE) break;
            if (ds == DecodeStatus::FRAME_ERROR) {
                std::cerr << "[CONN] " << c.id << " " << DecodeStatusStr(ds) << ", frame skipped\n";
                continue;
            }

            c.state.store(ConnState::DISPATCHING);
            std::string reply;
            const DispatchStatus rs = m_dispatcher.Dispatch(m, peer, reply);

            if (!reply.empty() && !c.stream.SendAll(reply)) {
                std::cerr << "[CONN] " << c.id << " reply failed status="
                          << net::SocketStatusStr(c.stream.lastSendStatus())
                          << " errno=" << c.stream.lastSendErrno() << "\n";
                done = true;
                break;
            }
            if (rs == DispatchStatus::QUIT) {
                done = true;
                break;
            }
            c.state.store(ConnState::READING);
        }
    }

    const ConnState last = c.state.exchange(ConnState::CLOSED);
    m_registry.ClearIfOwner(c.id);
    std::cout << "[CONN] " << c.id << " " << c.peer_host << ":" << c.peer_port
              << " closed while " << ConnStateStr(last) << "\n";
}

void CommandServer::reapFinished() {
    std::list<std::unique_ptr<Connection>> finished;
    {
        std::lock_guard<Rtos::Mutex> lk(m_conn_lock);
        for (auto it = m_conns.begin(); it != m_conns.end();) {
            Connection& c = **it;
            const bool done = c.task.IsCreated() ? c.task.IsFinished()
                                                 : (c.state.load() == ConnState::CLOSED);
            if (done) {
                finished.push_back(std::move(*it));
                it = m_conns.erase(it);
            } else {
                ++it;
            }
        }
    }
    // Joins return immediately: the entry function has already returned.
    for (auto& c : finished) {
        c->task.Join();
    }
}

void CommandServer::closeAll() {
    std::list<std::unique_ptr<Connection>> conns;
    {
        std::lock_guard<Rtos::Mutex> lk(m_conn_lock);
        conns.swap(m_conns);
    }

    for (auto& c : conns) {
        c->stream.Shutdown();
    }

    for (auto& c : conns) {
        if (!c->task.IsCreated()) continue;
        if (!c->task.JoinFor(m_cfg.conn_join_timeout_ms)) {
            std::cerr << "[SERVER] conn " << c->id << " did not stop within "
                      << m_cfg.conn_join_timeout_ms << " ms, abandoning it\n";
            // The task still references the Connection; it must outlive us.
            (void)c.release();
        }
    }
}

} // namespace ctrl
