#pragma once
#include <cstddef> // Required for size_t
#include <cstdint>

namespace Rtos {

// Sentinel for "block forever" on the timed calls below.
static constexpr uint32_t MAX_TIMEOUT = 0xFFFFFFFFu;

void SleepMs(uint32_t ms);

// Monotonic clock in microseconds. Only differences are meaningful.
uint64_t NowUs();

//== Task abstraction ==//
// One OS thread running a plain C entry point. The arg object must outlive
// the task (main-scope context or heap object owned by whoever joins it).
class Task {
public:
    Task();
    ~Task();

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    // Returns false if the thread could not be created.
    bool Create(const char* name, void (*fn)(void*), void* arg);

    void Join();

    // Bounded join. Returns false if the thread is still running after
    // timeout_ms; the task can be joined again later.
    bool JoinFor(uint32_t timeout_ms);

    bool IsCreated() const;
    bool IsFinished() const;   // entry function has returned
    const char* Name() const;

private:
    struct TaskHandle;
    TaskHandle* handle_;
};

//== Mutex abstraction ==//
// Satisfies BasicLockable, so std::lock_guard<Rtos::Mutex> works.
class Mutex {
public:
    Mutex();
    ~Mutex();

    Mutex(const Mutex&) = delete;
    Mutex& operator=(const Mutex&) = delete;

    void lock();
    void unlock();

private:
    struct MutexHandle;
    MutexHandle* handle_;
};

//== Binary Semaphore abstraction ==//
class BinarySemaphore {
public:
    BinarySemaphore();
    ~BinarySemaphore();

    BinarySemaphore(const BinarySemaphore&) = delete;
    BinarySemaphore& operator=(const BinarySemaphore&) = delete;

    void take();                      // Blocks until available
    bool try_take();                  // Non-blocking
    bool take_for(uint32_t timeout_ms); // false on timeout
    void give();                      // Releases the semaphore

private:
    struct SemaphoreHandle;
    SemaphoreHandle* handle_;
};


//== Counting Semaphore abstraction ==//
class CountingSemaphore {
public:
    /**
     * @param maxCount    Maximum count (e.g. queue capacity)
     * @param initialCount  Starting count
     */
    CountingSemaphore(size_t maxCount, size_t initialCount);
    ~CountingSemaphore();

    CountingSemaphore(const CountingSemaphore&) = delete;
    CountingSemaphore& operator=(const CountingSemaphore&) = delete;

    void take();      // block until count>0, then --count
    bool try_take();  // non-blocking: if count>0 then --count, else false
    bool take_for(uint32_t timeout_ms);
    void give();      // ++count, wake one waiter if present

private:
    struct CountingSemHandle;
    CountingSemHandle* handle_;
};

//== Queue abstraction ==//
// Fixed-size statically allocated queue (circular buffer) synchronised with
// the OSAL Mutex and CountingSemaphore primitives.
//
// overwrite=false: send() blocks while the queue is full.
// overwrite=true : send() never blocks; a full queue drops its oldest item
//                  ("freshest wins"). With Capacity 1 this is a latest-value
//                  mailbox.
template <typename T, size_t Capacity>
class Queue {
public:
    explicit Queue(bool overwrite = false)
    : head(0), tail(0), m_overwrite(overwrite) {}

    bool send(const T& item, uint32_t timeout_ms = MAX_TIMEOUT) {
        if (m_overwrite) {
            lock.lock();
            if (spaceAvailable.try_take()) {
                push(item);
                m_last_overwritten = false;
                lock.unlock();
                dataAvailable.give();
                return true;
            }
            if (dataAvailable.try_take()) {
                // Full: retire the oldest unread item and reuse its token.
                tail = (tail + 1) % Capacity;
                push(item);
                m_last_overwritten = true;
                lock.unlock();
                dataAvailable.give();
                return true;
            }
            // The only unread item is being received right now; its slot
            // frees up as soon as the receiver drops the lock.
            lock.unlock();
        }

        if (timeout_ms == MAX_TIMEOUT) {
            spaceAvailable.take();
        } else if (!spaceAvailable.take_for(timeout_ms)) {
            return false;
        }
        lock.lock();
        push(item);
        m_last_overwritten = false;
        lock.unlock();
        dataAvailable.give();
        return true;
    }

    bool try_send(const T& item) {
        if (m_overwrite) return send(item);
        if (!spaceAvailable.try_take()) return false;
        lock.lock();
        push(item);
        lock.unlock();
        dataAvailable.give();
        return true;
    }

    void receive(T& item) {
        dataAvailable.take();  // Wait for data
        pop(item);
    }

    bool receive_for(T& item, uint32_t timeout_ms) {
        if (!dataAvailable.take_for(timeout_ms)) return false;
        pop(item);
        return true;
    }

    bool try_receive(T& item) {
        if (!dataAvailable.try_take()) return false;
        pop(item);
        return true;
    }

    // Only meaningful for overwrite queues, read by the sending task.
    bool wasLastSendOverwritten() const { return m_last_overwritten; }

private:
    void push(const T& item) {
        buffer[head] = item;
        head = (head + 1) % Capacity;
    }

    void pop(T& item) {
        lock.lock();
        item = buffer[tail];
        tail = (tail + 1) % Capacity;
        lock.unlock();
        spaceAvailable.give(); // Signal space is available
    }

    T buffer[Capacity];
    size_t head, tail;
    const bool m_overwrite;
    bool m_last_overwritten = false;

    Mutex lock;
    CountingSemaphore spaceAvailable{Capacity, Capacity};  // Initially full space
    CountingSemaphore dataAvailable{Capacity, 0};          // Initially no data
};
} // namespace Rtos
