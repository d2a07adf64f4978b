#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

#include "net/SocketStatus.hpp"

namespace net {

// ------------------------------
// TcpStream: one connected TCP socket (owning fd).
// One reader task may Recv while one writer at a time SendAll()s: receive
// and send faults are kept in separate slots. Shutdown() may be called from
// any task to unblock a pending Recv. Writers sharing a stream must serialise
// through their own gate.
// ------------------------------
class TcpStream {
public:
    TcpStream() = default;
    explicit TcpStream(int fd) : m_fd(fd) {}
    ~TcpStream();

    TcpStream(const TcpStream&) = delete;
    TcpStream& operator=(const TcpStream&) = delete;
    TcpStream(TcpStream&& other) noexcept;
    TcpStream& operator=(TcpStream&& other) noexcept;

    // Blocking connect to an IPv4 dotted-quad host.
    bool Connect(const std::string& host, uint16_t port);

    // Reads up to cap bytes. Returns false with PEER_CLOSED on orderly close,
    // TIMEOUT if a receive timeout is set and expired, RECV_FAIL otherwise.
    bool Recv(uint8_t* buf, std::size_t cap, std::size_t& n_read);

    // Writes the whole buffer (loops over short writes, no SIGPIPE).
    // Failures land in lastSendStatus()/lastSendErrno().
    bool SendAll(const uint8_t* data, std::size_t len);
    bool SendAll(const std::string& s) {
        return SendAll(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }

    // 0 disables the timeout.
    bool SetRecvTimeoutMs(uint32_t ms);

    // Thread-safe: wake any blocked Recv and mark the stream as closed by us.
    void Shutdown();

    // Owner only: release the descriptor.
    void Close();

    bool IsOpen() const { return m_fd >= 0; }

    // Connect, Recv and SetRecvTimeoutMs faults (reader side).
    SocketStatus lastStatus() const { return m_status; }
    int          lastErrno()  const { return m_errno; }

    // SendAll faults (writer side).
    SocketStatus lastSendStatus() const { return m_tx_status; }
    int          lastSendErrno()  const { return m_tx_errno; }

private:
    bool fail(SocketStatus s);
    bool failSend(SocketStatus s);

    int m_fd = -1;
    std::atomic<bool> m_shutdown{false};

    // FDIR
    SocketStatus m_status = SocketStatus::OK;
    int          m_errno  = 0;
    SocketStatus m_tx_status = SocketStatus::OK;
    int          m_tx_errno  = 0;
};

// ------------------------------
// TcpListener: bound + listening socket.
// Accept() runs on the accept task; RequestClose() is the cancellation token
// used by the shutdown path and may be called from any task.
// ------------------------------
class TcpListener {
public:
    TcpListener() = default;
    ~TcpListener();

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    // host "0.0.0.0" binds all interfaces; port 0 picks an ephemeral port.
    bool Open(const std::string& host, uint16_t port, int backlog);

    // Blocks until a peer connects. On failure lastStatus() is CLOSED_BY_US
    // when RequestClose() was called, ACCEPT_FAIL for a genuine fault.
    bool Accept(TcpStream& out, std::string& peer_host, uint16_t& peer_port);

    // Thread-safe. Unblocks a pending Accept().
    void RequestClose();

    // Owner only, after the accept task has left Accept().
    void Close();

    bool     IsOpen() const { return m_fd >= 0; }
    uint16_t BoundPort() const { return m_bound_port; }

    SocketStatus lastStatus() const { return m_status; }
    int          lastErrno()  const { return m_errno; }

private:
    bool fail(SocketStatus s);

    int m_fd = -1;
    uint16_t m_bound_port = 0;
    std::atomic<bool> m_close_requested{false};

    // FDIR
    SocketStatus m_status = SocketStatus::OK;
    int          m_errno  = 0;
};

} // namespace net
