#pragma once
#include <atomic>
#include <cstdint>
#include <string>

#include "os/rtos.hpp"
#include "msg/Message.hpp"
#include "msg/VehicleState.hpp"
#include "apps/core/ShutdownCoordinator.hpp"
#include "apps/station/OperatorLink.hpp"

namespace station {

// Latest vehicle status for the video overlay (freshest-wins).
using StatusQueue = Rtos::Queue<msg::StatusReport, 1>;

// ---------------------------------------------------------------------------
// StatusReceiver: reads the command connection, decodes replies, publishes
// each status_report and logs it. When the vehicle closes the connection
// the operator session ends.
// ---------------------------------------------------------------------------
class StatusReceiver {
public:
    // Task entry wiring for OSAL (void* arg).
    // NOTE: The TaskCtx object must outlive the task.
    struct TaskCtx {
        StatusReceiver* self = nullptr;
        StatusQueue*    status_out = nullptr;   // optional
    };

public:
    StatusReceiver(OperatorLink& link, core::ShutdownCoordinator* shutdown);

    static void TaskEntry(void* arg);

    // Marks the coming connection close as intentional. The caller then
    // shuts the link down to unblock the read.
    void RequestStop() { m_stop_requested.store(true); }
    bool StopRequested() const { return m_stop_requested.load(); }

    // Absent or non-numeric fields keep their defaults.
    static bool ParseStatusReport(const msg::Message& m, msg::StatusReport& out);

    uint32_t ReportsReceived() const { return m_reports.load(); }

private:
    void Run(StatusQueue* status_out);
    void handle(const msg::Message& m, StatusQueue* status_out);

private:
    OperatorLink&              m_link;
    core::ShutdownCoordinator* m_shutdown = nullptr;

    std::atomic<bool>     m_stop_requested{false};
    std::atomic<uint32_t> m_reports{0};
};

} // namespace station
