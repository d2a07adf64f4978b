#include "os/rtos.hpp"
#include <atomic>
#include <iostream>

Rtos::BinarySemaphore sem;
static std::atomic<bool> g_acquired{false};

void Consumer(void*) {
    std::cout << "[Consumer] Waiting for semaphore...\n";
    if (sem.try_take()) {
        std::cout << "[Consumer] Semaphore acquired immediately!\n";
    } else {
        std::cout << "[Consumer] Semaphore not available, waiting...\n";
        sem.take();  // blocks until Producer gives
        std::cout << "[Consumer] Semaphore acquired after waiting!\n";
    }
    g_acquired.store(true);
}

void Producer(void*) {
    Rtos::SleepMs(200);
    std::cout << "[Producer] Giving semaphore now.\n";
    sem.give();
}

int main() {
    std::cout << "=== rtos_semaphore_test ===\n";

    std::cout << "\n[Test 0] take() blocks until give()\n";
    {
        Rtos::Task consumerTask;
        Rtos::Task producerTask;

        consumerTask.Create("Consumer", Consumer, nullptr);
        producerTask.Create("Producer", Producer, nullptr);

        consumerTask.Join();
        producerTask.Join();

        if (!g_acquired.load()) {
            std::cout << "take(): FAIL\n";
            return 1;
        }
        std::cout << "take(): OK\n";
    }

    std::cout << "\n[Test 1] take_for() times out, then succeeds after give()\n";
    {
        Rtos::BinarySemaphore s;
        const uint64_t t0 = Rtos::NowUs();
        if (s.take_for(80)) {
            std::cout << "take_for on empty: FAIL\n";
            return 1;
        }
        const uint64_t dt_ms = (Rtos::NowUs() - t0) / 1000;
        if (dt_ms < 70) {
            std::cout << "take_for returned early (" << dt_ms << " ms): FAIL\n";
            return 1;
        }
        s.give();
        if (!s.take_for(80)) {
            std::cout << "take_for after give: FAIL\n";
            return 1;
        }
        std::cout << "take_for: OK\n";
    }

    std::cout << "\n[Test 2] give() is binary: two gives, one take\n";
    {
        Rtos::BinarySemaphore s;
        s.give();
        s.give();
        if (!s.try_take() || s.try_take()) {
            std::cout << "binary: FAIL\n";
            return 1;
        }
        std::cout << "binary: OK\n";
    }

    std::cout << "\n[Test 3] counting semaphore take_for\n";
    {
        Rtos::CountingSemaphore cs(2, 1);
        if (!cs.take_for(10) || cs.take_for(50)) {
            std::cout << "counting take_for: FAIL\n";
            return 1;
        }
        cs.give();
        cs.give();
        if (!cs.try_take() || !cs.try_take() || cs.try_take()) {
            std::cout << "counting give/take: FAIL\n";
            return 1;
        }
        std::cout << "counting: OK\n";
    }

    std::cout << "\n[Test 4] Task::JoinFor is bounded and IsFinished tracks exit\n";
    {
        Rtos::BinarySemaphore gate;
        Rtos::Task t;
        t.Create("Blocked", [](void* arg) { static_cast<Rtos::BinarySemaphore*>(arg)->take(); }, &gate);
        if (t.JoinFor(50) || t.IsFinished()) {
            std::cout << "JoinFor on blocked task: FAIL\n";
            return 1;
        }
        gate.give();
        if (!t.JoinFor(1000) || !t.IsFinished()) {
            std::cout << "JoinFor after release: FAIL\n";
            return 1;
        }
        std::cout << "JoinFor: OK\n";
    }

    std::cout << "\n[Main] Binary Semaphore Test complete.\n";
    return 0;
}
