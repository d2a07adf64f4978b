#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <string>

#include "os/rtos.hpp"
#include "net/TcpSocket.hpp"
#include "apps/ctrl/ClientTargetRegistry.hpp"
#include "apps/ctrl/CommandDispatcher.hpp"

namespace ctrl {

// Bytes per recv() on a command connection.
static constexpr std::size_t RX_CHUNK = 4096;

// ------------------------------
// Config
// ------------------------------
struct CommandServerConfig {
    std::string host = "0.0.0.0";
    uint16_t    port = 5051;          // 0 = ephemeral (tests)
    int         backlog = 4;

    // Bound for joining each connection task at stop.
    uint32_t conn_join_timeout_ms = 1000;

    // Pause after a genuine accept() fault before retrying.
    uint32_t accept_retry_ms = 100;
};

enum class ConnState : uint8_t {
    ACCEPTED = 0,
    READING,
    DISPATCHING,
    CLOSED,
};

const char* ConnStateStr(ConnState s);

// ---------------------------------------------------------------------------
// CommandServer: TCP command channel, one task per accepted connection.
//
// The accept task (TaskEntry) owns the listener and the connection table. It
// reaps finished connections as it goes; once the listener is closed by
// RequestStop() it shuts every live connection down, joins them (bounded)
// and returns.
// ---------------------------------------------------------------------------
class CommandServer {
public:
    // Task entry wiring for OSAL (void* arg).
    // NOTE: The TaskCtx object must outlive the task.
    struct TaskCtx {
        CommandServer* self = nullptr;
    };

public:
    CommandServer(const CommandServerConfig& cfg,
                  CommandDispatcher& dispatcher,
                  ClientTargetRegistry& registry);
    ~CommandServer();

    CommandServer(const CommandServer&) = delete;
    CommandServer& operator=(const CommandServer&) = delete;

    // Bind + listen. Call before starting the accept task.
    bool Open();

    // OSAL-compatible entry point: accept loop until RequestStop().
    static void TaskEntry(void* arg);

    // Thread-safe. Unblocks accept(); the accept task then winds down.
    void RequestStop();
    bool StopRequested() const { return m_stop_requested.load(); }

    // Stop hook signature for core::ShutdownCoordinator.
    static void StopHook(void* arg);

    uint16_t    BoundPort() const { return m_listener.BoundPort(); }
    std::size_t ActiveConnections() const;
    uint32_t    AcceptedTotal() const { return m_accepted.load(); }

    net::SocketStatus lastStatus() const { return m_listener.lastStatus(); }
    int               lastErrno()  const { return m_listener.lastErrno(); }

private:
    struct Connection {
        CommandServer*         server = nullptr;
        uint32_t               id = NO_OWNER;
        std::string            peer_host;
        uint16_t               peer_port = 0;
        net::TcpStream         stream;
        Rtos::Task             task;
        std::atomic<ConnState> state{ConnState::ACCEPTED};
        std::string            rx;   // bytes not yet forming a frame
    };

    void Run();
    void serveConnection(Connection& c);
    void reapFinished();
    void closeAll();

    static void ConnectionEntry(void* arg);

private:
    CommandServerConfig   m_cfg{};
    CommandDispatcher&    m_dispatcher;
    ClientTargetRegistry& m_registry;

    net::TcpListener      m_listener;
    std::atomic<bool>     m_stop_requested{false};

    mutable Rtos::Mutex   m_conn_lock;
    std::list<std::unique_ptr<Connection>> m_conns;

    uint32_t              m_next_id = NO_OWNER;
    std::atomic<uint32_t> m_accepted{0};
};

} // namespace ctrl
