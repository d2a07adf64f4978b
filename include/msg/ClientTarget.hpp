#pragma once
#include <cstdint>
#include <string>

namespace msg {

// Current media destination: the registering peer's IPv4 address plus the
// UDP port it asked for.
struct ClientTarget {
    std::string host;       // dotted quad, as seen on the accepted socket
    uint16_t    port = 0;

    bool operator==(const ClientTarget& other) const {
        return host == other.host && port == other.port;
    }
    bool operator!=(const ClientTarget& other) const { return !(*this == other); }
};

} // namespace msg
