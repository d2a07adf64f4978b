#include "net/UdpSocket.hpp"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <errno.h>

namespace net {

UdpSocket::~UdpSocket() {
    Close();
}

bool UdpSocket::Open() {
    if (m_fd >= 0) return true;
    m_status = SocketStatus::OK;
    m_errno  = 0;

    m_fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (m_fd < 0) return fail(SocketStatus::SOCKET_FAIL);
    return true;
}

bool UdpSocket::Bind(uint16_t port) {
    if (m_fd < 0 && !Open()) return false;

    int yes = 1;
    (void)::setsockopt(m_fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    // Frames are tens of KB; give the kernel room for a few of them.
    int rcvbuf = 1 << 20;
    (void)::setsockopt(m_fd, SOL_SOCKET, SO_RCVBUF, &rcvbuf, sizeof(rcvbuf));

    sockaddr_in addr{};
    addr.sin_family      = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port        = htons(port);

    if (::bind(m_fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        return fail(SocketStatus::BIND_FAIL);
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

bool UdpSocket::SendTo(const msg::ClientTarget& to, const uint8_t* data, std::size_t len) {
    if (m_fd < 0) return fail(SocketStatus::NOT_OPEN);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(to.port);
    if (::inet_pton(AF_INET, to.host.c_str(), &addr.sin_addr) != 1) {
        return fail(SocketStatus::BAD_ADDRESS);
    }

    ssize_t w;
    do {
        w = ::sendto(m_fd, data, len, 0, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    } while (w < 0 && errno == EINTR);

    if (w < 0) return fail(SocketStatus::SEND_FAIL);
    return true;
}

bool UdpSocket::RecvFrom(uint8_t* buf, std::size_t cap, std::size_t& n_read, std::string* from_host) {
    n_read = 0;
    if (m_fd < 0) return fail(SocketStatus::NOT_OPEN);

    sockaddr_in src{};
    socklen_t slen = sizeof(src);
    ssize_t r;
    do { r = ::recvfrom(m_fd, buf, cap, 0, reinterpret_cast<sockaddr*>(&src), &slen); }
    while (r < 0 && errno == EINTR);

    if (r < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) return fail(SocketStatus::TIMEOUT);
        return fail(SocketStatus::RECV_FAIL);
    }

    n_read = static_cast<std::size_t>(r);
    if (from_host) {
        char ip[INET_ADDRSTRLEN] = {0};
        ::inet_ntop(AF_INET, &src.sin_addr, ip, sizeof(ip));
        *from_host = ip;
    }
    return true;
}

bool UdpSocket::SetRecvTimeoutMs(uint32_t ms) {
    if (m_fd < 0) return fail(SocketStatus::NOT_OPEN);
    timeval tv{};
    tv.tv_sec  = static_cast<time_t>(ms / 1000u);
    tv.tv_usec = static_cast<suseconds_t>(ms % 1000u) * 1000;
    if (::setsockopt(m_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
        return fail(SocketStatus::SETSOCKOPT_FAIL);
    }
    return true;
}

void UdpSocket::Close() {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

bool UdpSocket::fail(SocketStatus s) {
    m_status = s;
    m_errno  = SocketStatusHasErrno(s) ? errno : 0;
    return false;
}

} // namespace net
