#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "net/SocketStatus.hpp"
#include "msg/ClientTarget.hpp"

namespace net {

// Anything that can take one datagram addressed to a ClientTarget.
// MediaRelay sends through this so tests can observe the output.
class DatagramSink {
public:
    virtual ~DatagramSink() = default;
    virtual bool SendTo(const msg::ClientTarget& to, const uint8_t* data, std::size_t len) = 0;
};

// ------------------------------
// UdpSocket: unconnected IPv4 datagram socket.
// Sender side only needs Open(); the receiver also calls Bind().
// ------------------------------
class UdpSocket : public DatagramSink {
public:
    UdpSocket() = default;
    ~UdpSocket() override;

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    bool Open();

    // Bind to INADDR_ANY:port (port 0 = ephemeral).
    bool Bind(uint16_t port);

    bool SendTo(const msg::ClientTarget& to, const uint8_t* data, std::size_t len) override;

    // Blocks for at most the receive timeout (0 = forever). TIMEOUT when
    // nothing arrived in time.
    bool RecvFrom(uint8_t* buf, std::size_t cap, std::size_t& n_read,
                  std::string* from_host = nullptr);

    bool SetRecvTimeoutMs(uint32_t ms);

    void Close();

    bool     IsOpen() const { return m_fd >= 0; }
    uint16_t BoundPort() const { return m_bound_port; }

    SocketStatus lastStatus() const { return m_status; }
    int          lastErrno()  const { return m_errno; }

private:
    bool fail(SocketStatus s);

    int m_fd = -1;
    uint16_t m_bound_port = 0;

    // FDIR
    SocketStatus m_status = SocketStatus::OK;
    int          m_errno  = 0;
};

// Largest payload a single IPv4 UDP datagram can carry.
static constexpr std::size_t UDP_MAX_PAYLOAD = 65507;

} // namespace net
