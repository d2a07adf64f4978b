#include "net/SocketStatus.hpp"

namespace net {

const char* SocketStatusStr(SocketStatus s) {
    switch (s) {
        case SocketStatus::OK:              return "OK";
        case SocketStatus::SOCKET_FAIL:     return "SOCKET_FAIL";
        case SocketStatus::SETSOCKOPT_FAIL: return "SETSOCKOPT_FAIL";
        case SocketStatus::BIND_FAIL:       return "BIND_FAIL";
        case SocketStatus::LISTEN_FAIL:     return "LISTEN_FAIL";
        case SocketStatus::ACCEPT_FAIL:     return "ACCEPT_FAIL";
        case SocketStatus::CONNECT_FAIL:    return "CONNECT_FAIL";
        case SocketStatus::RECV_FAIL:       return "RECV_FAIL";
        case SocketStatus::SEND_FAIL:       return "SEND_FAIL";
        case SocketStatus::NOT_OPEN:        return "NOT_OPEN";
        case SocketStatus::BAD_ADDRESS:     return "BAD_ADDRESS";
        case SocketStatus::PEER_CLOSED:     return "PEER_CLOSED";
        case SocketStatus::TIMEOUT:         return "TIMEOUT";
        case SocketStatus::CLOSED_BY_US:    return "CLOSED_BY_US";
        default:                            return "UNKNOWN";
    }
}

bool SocketStatusHasErrno(SocketStatus s) {
    switch (s) {
        case SocketStatus::SOCKET_FAIL:
        case SocketStatus::SETSOCKOPT_FAIL:
        case SocketStatus::BIND_FAIL:
        case SocketStatus::LISTEN_FAIL:
        case SocketStatus::ACCEPT_FAIL:
        case SocketStatus::CONNECT_FAIL:
        case SocketStatus::RECV_FAIL:
        case SocketStatus::SEND_FAIL:
            return true;
        default:
            return false;
    }
}

} // namespace net
