#include "net/TcpSocket.hpp"

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <errno.h>

namespace {

bool make_addr(const std::string& host, uint16_t port, sockaddr_in& out) {
    out = sockaddr_in{};
    out.sin_family = AF_INET;
    out.sin_port   = htons(port);
    return ::inet_pton(AF_INET, host.c_str(), &out.sin_addr) == 1;
}

timeval to_timeval(uint32_t ms) {
    timeval tv{};
    tv.tv_sec  = static_cast<time_t>(ms / 1000u);
    tv.tv_usec = static_cast<suseconds_t>(ms % 1000u) * 1000;
    return tv;
}

} // anonymous namespace

namespace net {

// =======================
// TcpStream
// =======================

TcpStream::~TcpStream() {
    Close();
}

TcpStream::TcpStream(TcpStream&& other) noexcept
: m_fd(other.m_fd)
, m_shutdown(other.m_shutdown.load())
, m_status(other.m_status)
, m_errno(other.m_errno)
, m_tx_status(other.m_tx_status)
, m_tx_errno(other.m_tx_errno) {
    other.m_fd = -1;
}

TcpStream& TcpStream::operator=(TcpStream&& other) noexcept {
    if (this != &other) {
        Close();
        m_fd = other.m_fd;
        m_shutdown.store(other.m_shutdown.load());
        m_status = other.m_status;
        m_errno  = other.m_errno;
        m_tx_status = other.m_tx_status;
        m_tx_errno  = other.m_tx_errno;
        other.m_fd = -1;
    }
    return *this;
}

bool TcpStream::Connect(const std::string& host, uint16_t port) {
    Close();
    m_status = SocketStatus::OK;
    m_errno  = 0;
    m_tx_status = SocketStatus::OK;
    m_tx_errno  = 0;
    m_shutdown.store(false);

    sockaddr_in addr{};
    if (!make_addr(host, port, addr)) return fail(SocketStatus::BAD_ADDRESS);

    m_fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (m_fd < 0) return fail(SocketStatus::SOCKET_FAIL);

    int r;
    do { r = ::connect(m_fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)); }
    while (r == -1 && errno == EINTR);
    if (r == -1) {
        fail(SocketStatus::CONNECT_FAIL);
        ::close(m_fd);
        m_fd = -1;
        return false;
    }

    // Small control messages: do not wait for Nagle.
    int yes = 1;
    (void)::setsockopt(m_fd, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));
    return true;
}

bool TcpStream::Recv(uint8_t* buf, std::size_t cap, std::size_t& n_read) {
    n_read = 0;
    if (m_fd < 0) return fail(SocketStatus::NOT_OPEN);

    ssize_t r;
    do { r = ::recv(m_fd, buf, cap, 0); }
    while (r == -1 && errno == EINTR);

    if (r > 0) {
        n_read = static_cast<std::size_t>(r);
        return true;
    }
    if (m_shutdown.load()) return fail(SocketStatus::CLOSED_BY_US);
    if (r == 0) return fail(SocketStatus::PEER_CLOSED);
    if (errno == EAGAIN || errno == EWOULDBLOCK) return fail(SocketStatus::TIMEOUT);
    return fail(SocketStatus::RECV_FAIL);
}

bool TcpStream::SendAll(const uint8_t* data, std::size_t len) {
    if (m_fd < 0) return failSend(SocketStatus::NOT_OPEN);

    while (len > 0) {
        const ssize_t w = ::send(m_fd, data, len, MSG_NOSIGNAL);
        if (w < 0) {
            if (errno == EINTR) continue;
            return failSend(SocketStatus::SEND_FAIL);
        }
        data += static_cast<std::size_t>(w);
        len  -= static_cast<std::size_t>(w);
    }
    return true;
}

bool TcpStream::SetRecvTimeoutMs(uint32_t ms) {
    if (m_fd < 0) return fail(SocketStatus::NOT_OPEN);
    const timeval tv = to_timeval(ms);
    if (::setsockopt(m_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
        return fail(SocketStatus::SETSOCKOPT_FAIL);
    }
    return true;
}

void TcpStream::Shutdown() {
    m_shutdown.store(true);
    if (m_fd >= 0) {
        (void)::shutdown(m_fd, SHUT_RDWR);
    }
}

void TcpStream::Close() {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

bool TcpStream::fail(SocketStatus s) {
    m_status = s;
    m_errno  = SocketStatusHasErrno(s) ? errno : 0;
    return false;
}

bool TcpStream::failSend(SocketStatus s) {
    m_tx_status = s;
    m_tx_errno  = SocketStatusHasErrno(s) ? errno : 0;
    return false;
}

// =======================
// TcpListener
// =======================

TcpListener::~TcpListener() {
    Close();
}

bool TcpListener::Open(const std::string& host, uint16_t port, int backlog) {
    Close();
    m_status = SocketStatus::OK;
    m_errno  = 0;
    m_close_requested.store(false);

    sockaddr_in addr{};
    if (!make_addr(host, port, addr)) return fail(SocketStatus::BAD_ADDRESS);

    m_fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (m_fd < 0) return fail(SocketStatus::SOCKET_FAIL);

    // Allow immediate rebinding after a restart.
    int yes = 1;
    if (::setsockopt(m_fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) != 0) {
        fail(SocketStatus::SETSOCKOPT_FAIL);
        Close();
        return false;
    }

    if (::bind(m_fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        fail(SocketStatus::BIND_FAIL);
        Close();
        return false;
    }
    if (::listen(m_fd, backlog) < 0) {
        fail(SocketStatus::LISTEN_FAIL);
        Close();
        return false;
    }

    sockaddr_in bound{};
    socklen_t blen = sizeof(bound);
    if (::getsockname(m_fd, reinterpret_cast<sockaddr*>(&bound), &blen) == 0) {
        m_bound_port = ntohs(bound.sin_port);
    } else {
        m_bound_port = port;
    }
    return true;
}

bool TcpListener::Accept(TcpStream& out, std::string& peer_host, uint16_t& peer_port) {
    if (m_fd < 0) return fail(SocketStatus::NOT_OPEN);

    while (true) {
        sockaddr_in caddr{};
        socklen_t clen = sizeof(caddr);
        const int cfd = ::accept4(m_fd, reinterpret_cast<sockaddr*>(&caddr), &clen, SOCK_CLOEXEC);

        if (cfd >= 0) {
            if (m_close_requested.load()) {
                // Raced with shutdown: do not hand out new connections.
                ::close(cfd);
                return fail(SocketStatus::CLOSED_BY_US);
            }
            char ip[INET_ADDRSTRLEN] = {0};
            ::inet_ntop(AF_INET, &caddr.sin_addr, ip, sizeof(ip));
            peer_host = ip;
            peer_port = ntohs(caddr.sin_port);

            int yes = 1;
            (void)::setsockopt(cfd, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));

            out = TcpStream(cfd);
            return true;
        }

        if (m_close_requested.load()) return fail(SocketStatus::CLOSED_BY_US);

        // Transient: signal, or the peer gave up before we accepted.
        if (errno == EINTR || errno == ECONNABORTED) continue;

        return fail(SocketStatus::ACCEPT_FAIL);
    }
}

void TcpListener::RequestClose() {
    m_close_requested.store(true);
    if (m_fd >= 0) {
        // shutdown() on a listening socket makes a blocked accept() return
        // EINVAL; the fd itself stays valid until Close().
        (void)::shutdown(m_fd, SHUT_RDWR);
    }
}

void TcpListener::Close() {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

bool TcpListener::fail(SocketStatus s) {
    m_status = s;
    m_errno  = SocketStatusHasErrno(s) ? errno : 0;
    return false;
}

} // namespace net
