#include "apps/station/OperatorLink.hpp"
#include "apps/ctrl/FrameCodec.hpp"

#include <cstring>
#include <iostream>
#include <mutex>

namespace station {

bool OperatorLink::Connect(const std::string& host, uint16_t port) {
    if (!m_stream.Connect(host, port)) {
        std::cerr << "[OPERATOR] connect to " << host << ":" << port << " failed status="
                  << net::SocketStatusStr(m_stream.lastStatus())
                  << " errno=" << m_stream.lastErrno()
                  << " (" << std::strerror(m_stream.lastErrno()) << ")\n";
        return false;
    }
    std::cout << "[OPERATOR] connected to " << host << ":" << port << "\n";
    return true;
}

bool OperatorLink::SendMessage(const msg::Message& m, net::SocketStatus* status, int* err) {
    const std::string frame = ctrl::FrameCodec::Encode(m);

    std::lock_guard<Rtos::Mutex> lk(m_write_lock);
    if (!m_stream.SendAll(frame)) {
        if (status) *status = m_stream.lastSendStatus();
        if (err)    *err    = m_stream.lastSendErrno();
        return false;
    }
    m_frames_sent.fetch_add(1);
    return true;
}

bool OperatorLink::Recv(uint8_t* buf, std::size_t cap, std::size_t& n_read) {
    return m_stream.Recv(buf, cap, n_read);
}

void OperatorLink::Shutdown() {
    m_stream.Shutdown();
}

void OperatorLink::Close() {
    std::lock_guard<Rtos::Mutex> lk(m_write_lock);
    m_stream.Close();
}

} // namespace station
