#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>

#include "os/rtos.hpp"

namespace core {

static constexpr std::size_t SHUTDOWN_MAX_HOOKS = 8;
static constexpr std::size_t SHUTDOWN_MAX_TASKS = 8;

// ---------------------------------------------------------------------------
// ShutdownCoordinator: one process-wide stop signal.
//
// Any task may call RequestShutdown(); the first call runs every stop hook
// (close the listener, stop the relay, ...) in registration order and wakes
// WaitFor(). Later calls are no-ops. The driver then JoinAll()s the
// registered tasks, each with a bounded wait.
//
// Hooks run on the requesting task and must not block.
// ---------------------------------------------------------------------------
class ShutdownCoordinator {
public:
    using HookFn = void (*)(void*);

    // Register before any task can request shutdown. False when full.
    bool AddStopHook(const char* name, HookFn fn, void* arg);
    bool AddTask(const char* name, Rtos::Task* task);

    // True only for the call that actually started the shutdown.
    bool RequestShutdown(const char* reason);

    bool ShutdownRequested() const { return m_requested.load(); }
    const char* Reason() const { return m_reason.load(); }

    // Blocks until shutdown is requested or timeout_ms elapses.
    // Returns ShutdownRequested().
    bool WaitFor(uint32_t timeout_ms);

    // Joins every registered task, giving each up to timeout_ms.
    // Returns the number of tasks still running afterwards.
    std::size_t JoinAll(uint32_t timeout_ms);

private:
    struct Hook {
        const char* name = "";
        HookFn fn = nullptr;
        void*  arg = nullptr;
    };
    struct TaskRef {
        const char* name = "";
        Rtos::Task* task = nullptr;
    };

    Rtos::Mutex m_lock;
    Hook        m_hooks[SHUTDOWN_MAX_HOOKS]{};
    std::size_t m_hook_count = 0;
    TaskRef     m_tasks[SHUTDOWN_MAX_TASKS]{};
    std::size_t m_task_count = 0;

    std::atomic<bool> m_requested{false};
    std::atomic<const char*> m_reason{""};
    Rtos::BinarySemaphore m_wake;
};

} // namespace core
