#include "apps/core/ShutdownCoordinator.hpp"

#include <iostream>
#include <mutex>

namespace core {

bool ShutdownCoordinator::AddStopHook(const char* name, HookFn fn, void* arg) {
    if (!fn) return false;
    std::lock_guard<Rtos::Mutex> lk(m_lock);
    if (m_hook_count >= SHUTDOWN_MAX_HOOKS) {
        std::cerr << "[SHUTDOWN] hook table full, dropping " << (name ? name : "?") << "\n";
        return false;
    }
    m_hooks[m_hook_count++] = Hook{name ? name : "hook", fn, arg};
    return true;
}

bool ShutdownCoordinator::AddTask(const char* name, Rtos::Task* task) {
    if (!task) return false;
    std::lock_guard<Rtos::Mutex> lk(m_lock);
    if (m_task_count >= SHUTDOWN_MAX_TASKS) {
        std::cerr << "[SHUTDOWN] task table full, dropping " << (name ? name : "?") << "\n";
        return false;
    }
    m_tasks[m_task_count++] = TaskRef{name ? name : task->Name(), task};
    return true;
}

bool ShutdownCoordinator::RequestShutdown(const char* reason) {
    bool expected = false;
    if (!m_requested.compare_exchange_strong(expected, true)) {
        return false;
    }
    m_reason.store(reason ? reason : "unspecified");
    std::cout << "[SHUTDOWN] requested: " << m_reason.load() << "\n";

    // Snapshot under the lock, run outside it: a hook may log or touch
    // sockets but must never re-enter the coordinator's table.
    Hook hooks[SHUTDOWN_MAX_HOOKS];
    std::size_t n = 0;
    {
        std::lock_guard<Rtos::Mutex> lk(m_lock);
        n = m_hook_count;
        for (std::size_t i = 0; i < n; ++i) hooks[i] = m_hooks[i];
    }
    for (std::size_t i = 0; i < n; ++i) {
        std::cout << "[SHUTDOWN] stop hook: " << hooks[i].name << "\n";
        hooks[i].fn(hooks[i].arg);
    }

    m_wake.give();
    return true;
}

bool ShutdownCoordinator::WaitFor(uint32_t timeout_ms) {
    if (m_requested.load()) return true;
    if (m_wake.take_for(timeout_ms)) {
        // keep later waiters from blocking
        m_wake.give();
    }
    return m_requested.load();
}

std::size_t ShutdownCoordinator::JoinAll(uint32_t timeout_ms) {
    TaskRef tasks[SHUTDOWN_MAX_TASKS];
    std::size_t n = 0;
    {
        std::lock_guard<Rtos::Mutex> lk(m_lock);
        n = m_task_count;
        for (std::size_t i = 0; i < n; ++i) tasks[i] = m_tasks[i];
    }

    std::size_t stuck = 0;
    for (std::size_t i = 0; i < n; ++i) {
        if (!tasks[i].task->IsCreated()) continue;
        if (tasks[i].task->JoinFor(timeout_ms)) {
            std::cout << "[SHUTDOWN] joined " << tasks[i].name << "\n";
        } else {
            std::cerr << "[SHUTDOWN] " << tasks[i].name << " still running after "
                      << timeout_ms << " ms, leaving it detached\n";
            ++stuck;
        }
    }
    return stuck;
}

} // namespace core
