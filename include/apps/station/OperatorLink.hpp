#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

#include "os/rtos.hpp"
#include "net/TcpSocket.hpp"
#include "msg/Message.hpp"

namespace station {

// ---------------------------------------------------------------------------
// OperatorLink: the one outbound command-channel connection.
// Several tasks write (command sender, shutdown path); every write goes
// through one gate so frames never interleave. Only the status receiver
// reads.
// ---------------------------------------------------------------------------
class OperatorLink {
public:
    bool Connect(const std::string& host, uint16_t port);

    // Encodes and writes one frame under the write gate. On failure the
    // writer's own fault is copied out before the gate is released.
    bool SendMessage(const msg::Message& m,
                     net::SocketStatus* status = nullptr,
                     int* err = nullptr);

    // Status receiver only. Faults are read back with lastRecvStatus().
    bool Recv(uint8_t* buf, std::size_t cap, std::size_t& n_read);

    // Thread-safe: unblocks Recv(); later sends fail.
    void Shutdown();

    // Owner only, after every task using the link has been joined.
    void Close();

    bool IsOpen() const { return m_stream.IsOpen(); }

    uint32_t FramesSent() const { return m_frames_sent.load(); }

    // Status receiver only.
    net::SocketStatus lastRecvStatus() const { return m_stream.lastStatus(); }
    int               lastRecvErrno()  const { return m_stream.lastErrno(); }

private:
    net::TcpStream m_stream;
    Rtos::Mutex    m_write_lock;
    std::atomic<uint32_t> m_frames_sent{0};
};

} // namespace station
