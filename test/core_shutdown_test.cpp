// ShutdownCoordinator: once-only hooks, wake-up, bounded joins.

#include <atomic>
#include <iostream>

#include "os/rtos.hpp"
#include "apps/core/ShutdownCoordinator.hpp"

static std::atomic<int> g_hook_a{0};
static std::atomic<int> g_hook_b{0};
static std::atomic<int> g_order{0};
static int g_a_pos = -1;
static int g_b_pos = -1;

static void hookA(void*) { g_a_pos = g_order++; ++g_hook_a; }
static void hookB(void* arg) {
    g_b_pos = g_order++;
    ++g_hook_b;
    static_cast<std::atomic<bool>*>(arg)->store(true);
}

struct RequestCtx {
    core::ShutdownCoordinator* sd = nullptr;
    std::atomic<int>* winners = nullptr;
};

static void requester(void* arg) {
    auto* c = static_cast<RequestCtx*>(arg);
    if (c->sd->RequestShutdown("race")) ++(*c->winners);
}

static void quickTask(void*) { Rtos::SleepMs(20); }

static std::atomic<bool> g_release{false};
static void stuckTask(void*) {
    while (!g_release.load()) Rtos::SleepMs(10);
}

int main() {
    std::cout << "=== core_shutdown_test ===\n";

    std::cout << "\n[Test 0] WaitFor times out while nothing is requested\n";
    {
        core::ShutdownCoordinator sd;
        const uint64_t t0 = Rtos::NowUs();
        if (sd.WaitFor(100) || sd.ShutdownRequested()) {
            std::cout << "timeout: FAIL\n";
            return 1;
        }
        const uint64_t dt_ms = (Rtos::NowUs() - t0) / 1000ull;
        if (dt_ms < 80) {
            std::cout << "timeout too short: FAIL dt=" << dt_ms << "\n";
            return 1;
        }
        std::cout << "timeout: OK\n";
    }

    std::cout << "\n[Test 1] concurrent requests: one winner, hooks run once in order\n";
    {
        core::ShutdownCoordinator sd;
        std::atomic<bool> flag{false};
        sd.AddStopHook("a", hookA, nullptr);
        sd.AddStopHook("b", hookB, &flag);

        std::atomic<int> winners{0};
        static RequestCtx ctx{};
        ctx.sd = &sd;
        ctx.winners = &winners;
        Rtos::Task t[4];
        for (auto& task : t) task.Create("requester", requester, &ctx);
        for (auto& task : t) task.Join();

        if (winners != 1 || g_hook_a != 1 || g_hook_b != 1 || !flag.load() ||
            g_a_pos != 0 || g_b_pos != 1) {
            std::cout << "once: FAIL winners=" << winners << "\n";
            return 1;
        }
        if (sd.RequestShutdown("late") || std::string(sd.Reason()) != "race") {
            std::cout << "late request: FAIL\n";
            return 1;
        }
        // Every waiter sees the request, repeatedly.
        if (!sd.WaitFor(0) || !sd.WaitFor(10) || !sd.WaitFor(Rtos::MAX_TIMEOUT)) {
            std::cout << "wait after request: FAIL\n";
            return 1;
        }
        std::cout << "once: OK\n";
    }

    std::cout << "\n[Test 2] WaitFor wakes promptly on request\n";
    {
        core::ShutdownCoordinator sd;
        static RequestCtx ctx{};
        std::atomic<int> winners{0};
        ctx.sd = &sd;
        ctx.winners = &winners;

        Rtos::Task t;
        const uint64_t t0 = Rtos::NowUs();
        t.Create("requester", requester, &ctx);
        const bool woke = sd.WaitFor(5000);
        const uint64_t dt_ms = (Rtos::NowUs() - t0) / 1000ull;
        t.Join();
        if (!woke || dt_ms > 1000) {
            std::cout << "wake: FAIL dt=" << dt_ms << "\n";
            return 1;
        }
        std::cout << "wake: OK in " << dt_ms << " ms\n";
    }

    std::cout << "\n[Test 3] JoinAll bounds a stuck task\n";
    {
        core::ShutdownCoordinator sd;
        Rtos::Task quick, stuck, never;
        quick.Create("quick", quickTask, nullptr);
        stuck.Create("stuck", stuckTask, nullptr);
        sd.AddTask("quick", &quick);
        sd.AddTask("stuck", &stuck);
        sd.AddTask("never", &never);   // not created: skipped

        const uint64_t t0 = Rtos::NowUs();
        const std::size_t n = sd.JoinAll(200);
        const uint64_t dt_ms = (Rtos::NowUs() - t0) / 1000ull;
        if (n != 1 || !quick.IsFinished() || dt_ms > 1500) {
            std::cout << "JoinAll: FAIL stuck=" << n << " dt=" << dt_ms << "\n";
            return 1;
        }
        g_release.store(true);
        stuck.Join();
        std::cout << "JoinAll: OK\n";
    }

    std::cout << "\n[Test 4] tables are bounded\n";
    {
        core::ShutdownCoordinator sd;
        std::size_t added = 0;
        for (std::size_t i = 0; i < core::SHUTDOWN_MAX_HOOKS + 2; ++i) {
            if (sd.AddStopHook("h", hookA, nullptr)) ++added;
        }
        if (added != core::SHUTDOWN_MAX_HOOKS || sd.AddStopHook("null", nullptr, nullptr)) {
            std::cout << "bounds: FAIL\n";
            return 1;
        }
        std::cout << "bounds: OK\n";
    }

    std::cout << "\n[Main] Test complete.\n";
    return 0;
}
