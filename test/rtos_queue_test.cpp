#include "os/rtos.hpp"
#include <iostream>

// Blocking queue of ints, capacity 5
Rtos::Queue<int, 5> queue;

static int g_received[10];
static bool g_order_ok = true;

void Producer(void*) {
    std::cout << "[Producer] Thread started\n";
    for (int i = 1; i <= 10; ++i) {
        queue.send(i);  // blocks while the queue is full
        Rtos::SleepMs(5);
    }
}

void Consumer(void*) {
    Rtos::SleepMs(100);   // let the producer fill the queue first
    std::cout << "[Consumer] Thread started\n";
    for (int i = 1; i <= 10; ++i) {
        int value = 0;
        queue.receive(value);
        g_received[i - 1] = value;
        if (value != i) g_order_ok = false;
        Rtos::SleepMs(10);
    }
}

int main() {
    std::cout << "=== rtos_queue_test ===\n";

    std::cout << "\n[Test 0] blocking producer/consumer keeps FIFO order\n";
    {
        Rtos::Task producerTask;
        Rtos::Task consumerTask;

        if (!producerTask.Create("Producer", Producer, nullptr) ||
            !consumerTask.Create("Consumer", Consumer, nullptr)) {
            std::cout << "Create(): FAIL\n";
            return 1;
        }
        producerTask.Join();
        consumerTask.Join();

        if (!g_order_ok) {
            std::cout << "FIFO: FAIL got";
            for (int v : g_received) std::cout << " " << v;
            std::cout << "\n";
            return 1;
        }
        std::cout << "FIFO: OK\n";
    }

    std::cout << "\n[Test 1] overwrite queue keeps the freshest item\n";
    {
        Rtos::Queue<int, 1> latest(/*overwrite=*/true);
        for (int i = 0; i < 5; ++i) latest.send(i);
        if (!latest.wasLastSendOverwritten()) {
            std::cout << "wasLastSendOverwritten(): FAIL\n";
            return 1;
        }
        int v = -1;
        if (!latest.try_receive(v) || v != 4) {
            std::cout << "freshest: FAIL got " << v << "\n";
            return 1;
        }
        if (latest.try_receive(v)) {
            std::cout << "empty after receive: FAIL\n";
            return 1;
        }
        std::cout << "freshest: OK\n";
    }

    std::cout << "\n[Test 2] overwrite queue with capacity 3 drops oldest\n";
    {
        Rtos::Queue<int, 3> q(/*overwrite=*/true);
        for (int i = 1; i <= 5; ++i) q.send(i);
        int a = 0, b = 0, c = 0;
        if (!q.try_receive(a) || !q.try_receive(b) || !q.try_receive(c) || a != 3 || b != 4 || c != 5) {
            std::cout << "drop oldest: FAIL got " << a << " " << b << " " << c << "\n";
            return 1;
        }
        std::cout << "drop oldest: OK\n";
    }

    std::cout << "\n[Test 3] receive_for times out on an empty queue\n";
    {
        Rtos::Queue<int, 2> q;
        int v = 0;
        const uint64_t t0 = Rtos::NowUs();
        const bool got = q.receive_for(v, 100);
        const uint64_t dt_ms = (Rtos::NowUs() - t0) / 1000;
        if (got || dt_ms < 90 || dt_ms > 1000) {
            std::cout << "receive_for: FAIL got=" << got << " dt=" << dt_ms << "ms\n";
            return 1;
        }
        std::cout << "receive_for timeout (" << dt_ms << " ms): OK\n";
    }

    std::cout << "\n[Test 4] send with timeout fails on a full blocking queue\n";
    {
        Rtos::Queue<int, 1> q;
        if (!q.try_send(1) || q.try_send(2) || q.send(3, 50)) {
            std::cout << "full queue: FAIL\n";
            return 1;
        }
        std::cout << "full queue: OK\n";
    }

    std::cout << "\n[Main] Test complete.\n";
    return 0;
}
