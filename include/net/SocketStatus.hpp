#pragma once
#include <cstdint>

namespace net {

enum class SocketStatus : uint8_t {
    OK = 0,
    // SYSCALL FAILS
    SOCKET_FAIL,
    SETSOCKOPT_FAIL,
    BIND_FAIL,
    LISTEN_FAIL,
    ACCEPT_FAIL,
    CONNECT_FAIL,
    RECV_FAIL,
    SEND_FAIL,

    // LOGIC / STATE
    NOT_OPEN,
    BAD_ADDRESS,
    PEER_CLOSED,    // orderly zero-length read
    TIMEOUT,        // receive timeout elapsed, nothing read
    CLOSED_BY_US,   // we closed the socket on purpose (shutdown path)
};

const char* SocketStatusStr(SocketStatus s);

// True for statuses that carry a meaningful errno.
bool SocketStatusHasErrno(SocketStatus s);

} // namespace net
