#include "os/rtos.hpp"
#include <pthread.h>
#include <semaphore.h>
#include <time.h>
#include <errno.h>
#include <atomic>
#include <memory>
#include <string>
#include <iostream>   // for std::cerr

namespace Rtos {

namespace {

// Absolute deadline on the given clock, timeout_ms from now.
timespec deadline_after(clockid_t clock, uint32_t timeout_ms) {
    timespec ts{};
    ::clock_gettime(clock, &ts);
    ts.tv_sec  += static_cast<time_t>(timeout_ms / 1000u);
    ts.tv_nsec += static_cast<long>(timeout_ms % 1000u) * 1000000L;
    if (ts.tv_nsec >= 1000000000L) {
        ts.tv_sec  += 1;
        ts.tv_nsec -= 1000000000L;
    }
    return ts;
}

} // anonymous namespace

// Sleep utility
void SleepMs(uint32_t ms) {
    timespec req{};
    req.tv_sec  = static_cast<time_t>(ms / 1000u);
    req.tv_nsec = static_cast<long>(ms % 1000u) * 1000000L;
    while (::nanosleep(&req, &req) == -1 && errno == EINTR) {
    }
}

uint64_t NowUs() {
    timespec ts{};
    ::clock_gettime(CLOCK_MONOTONIC, &ts);
    return uint64_t(ts.tv_sec) * 1000000ull + uint64_t(ts.tv_nsec) / 1000ull;
}

// =======================
// Task Implementation
// =======================

// Shared between the Task object and the running thread, so a detached
// thread never writes into a destroyed handle.
struct TaskShared {
    std::atomic<bool> finished{false};
};

// Wrapper to convert function pointer to pthread-style
struct ThreadArgs {
    void (*fn)(void*);
    void* arg;
    std::shared_ptr<TaskShared> shared;
};

// Static thread entry point
static void* threadEntryPoint(void* ptr) {
    ThreadArgs* args = static_cast<ThreadArgs*>(ptr);
    args->fn(args->arg);
    args->shared->finished.store(true);
    delete args;
    return nullptr;
}

// Platform-specific handle
struct Task::TaskHandle {
    pthread_t thread;
    bool created = false;
    bool joined = false;
    std::string name;
    std::shared_ptr<TaskShared> shared = std::make_shared<TaskShared>();
};

// Constructor
Task::Task() {
    handle_ = new TaskHandle{};
}

// Destructor
Task::~Task() {
    if (handle_ && !handle_->joined && handle_->created) {
        pthread_detach(handle_->thread);  // detach if not joined
    }
    delete handle_;
}

// Create a new thread
bool Task::Create(const char* name, void (*fn)(void*), void* arg) {
    if (handle_->created) {
        std::cerr << "[RTOS] Task " << handle_->name << " already created\n";
        return false;
    }

    handle_->name = name ? name : "task";
    auto* args = new ThreadArgs{fn, arg, handle_->shared};

    const int rc = pthread_create(&handle_->thread, nullptr, threadEntryPoint, args);
    if (rc != 0) {
        std::cerr << "[RTOS] Failed to create task " << handle_->name
                  << " rc=" << rc << "\n";
        delete args;
        return false;
    }
    handle_->created = true;

    // Linux limits thread names to 15 chars + NUL.
    const std::string short_name = handle_->name.substr(0, 15);
    (void)pthread_setname_np(handle_->thread, short_name.c_str());
    return true;
}

void Task::Join() {
    if (handle_ && handle_->created && !handle_->joined) {
        pthread_join(handle_->thread, nullptr);
        handle_->joined = true;
    }
}

bool Task::JoinFor(uint32_t timeout_ms) {
    if (!handle_ || !handle_->created || handle_->joined) return true;
    if (timeout_ms == MAX_TIMEOUT) {
        Join();
        return true;
    }

    // pthread_timedjoin_np takes a CLOCK_REALTIME deadline.
    const timespec deadline = deadline_after(CLOCK_REALTIME, timeout_ms);
    const int rc = pthread_timedjoin_np(handle_->thread, nullptr, &deadline);
    if (rc == 0) {
        handle_->joined = true;
        return true;
    }
    return false;
}

bool Task::IsCreated() const {
    return handle_ && handle_->created;
}

bool Task::IsFinished() const {
    return handle_ && handle_->created && handle_->shared->finished.load();
}

const char* Task::Name() const {
    return handle_ ? handle_->name.c_str() : "";
}

// =======================
// Mutex Implementation
// =======================

struct Mutex::MutexHandle {
    pthread_mutex_t native;
};

Mutex::Mutex() {
    handle_ = new MutexHandle;
    if (pthread_mutex_init(&handle_->native, nullptr) != 0) {
        std::cerr << "[RTOS] Mutex init failed\n";
    }
}

Mutex::~Mutex() {
    pthread_mutex_destroy(&handle_->native);
    delete handle_;
}

void Mutex::lock() {
    pthread_mutex_lock(&handle_->native);
}

void Mutex::unlock() {
    pthread_mutex_unlock(&handle_->native);
}

// =======================
// Binary Semaphore Implementation
// =======================

struct BinarySemaphore::SemaphoreHandle {
    pthread_mutex_t mutex;
    pthread_cond_t cond;
    bool available;  // acts like a binary flag
};

BinarySemaphore::BinarySemaphore() {
    handle_ = new SemaphoreHandle;
    pthread_mutex_init(&handle_->mutex, nullptr);

    // Monotonic condvar so take_for() is immune to wall-clock jumps.
    pthread_condattr_t attr;
    pthread_condattr_init(&attr);
    pthread_condattr_setclock(&attr, CLOCK_MONOTONIC);
    pthread_cond_init(&handle_->cond, &attr);
    pthread_condattr_destroy(&attr);

    handle_->available = false;  // starts as "not given"
}

BinarySemaphore::~BinarySemaphore() {
    pthread_cond_destroy(&handle_->cond);
    pthread_mutex_destroy(&handle_->mutex);
    delete handle_;
}

void BinarySemaphore::take() {
    pthread_mutex_lock(&handle_->mutex);
    while (!handle_->available) {
        pthread_cond_wait(&handle_->cond, &handle_->mutex);
    }
    handle_->available = false;  // consume the semaphore
    pthread_mutex_unlock(&handle_->mutex);
}

bool BinarySemaphore::try_take() {
    bool acquired = false;
    pthread_mutex_lock(&handle_->mutex);
    if (handle_->available) {
        handle_->available = false;
        acquired = true;
    }
    pthread_mutex_unlock(&handle_->mutex);
    return acquired;
}

bool BinarySemaphore::take_for(uint32_t timeout_ms) {
    if (timeout_ms == MAX_TIMEOUT) {
        take();
        return true;
    }

    const timespec deadline = deadline_after(CLOCK_MONOTONIC, timeout_ms);

    pthread_mutex_lock(&handle_->mutex);
    while (!handle_->available) {
        const int rc = pthread_cond_timedwait(&handle_->cond, &handle_->mutex, &deadline);
        if (rc == ETIMEDOUT) break;
    }
    const bool acquired = handle_->available;
    handle_->available = false;
    pthread_mutex_unlock(&handle_->mutex);
    return acquired;
}

void BinarySemaphore::give() {
    pthread_mutex_lock(&handle_->mutex);
    handle_->available = true;
    pthread_cond_signal(&handle_->cond);  // wake one waiting thread
    pthread_mutex_unlock(&handle_->mutex);
}

// =======================
// Counting Semaphore Implementation
// =======================

struct CountingSemaphore::CountingSemHandle {
    sem_t sem;
    unsigned maxCount;
};

CountingSemaphore::CountingSemaphore(size_t maxCount, size_t initialCount) {
    handle_ = new CountingSemHandle;
    handle_->maxCount = static_cast<unsigned>(maxCount);

    if (initialCount > maxCount) {
        std::cerr << "[CountingSemaphore] Error: Initial count > max count\n";
        initialCount = maxCount;  // clamp
    }

    if (sem_init(&handle_->sem, 0, static_cast<unsigned>(initialCount)) != 0) {
        std::cerr << "[CountingSemaphore] sem_init failed\n";
    }
}

CountingSemaphore::~CountingSemaphore() {
    sem_destroy(&handle_->sem);
    delete handle_;
}

void CountingSemaphore::take() {
    while (sem_wait(&handle_->sem) != 0) {
        if (errno != EINTR) {
            std::cerr << "[CountingSemaphore] sem_wait failed\n";
            return;
        }
    }
}

bool CountingSemaphore::try_take() {
    return (sem_trywait(&handle_->sem) == 0);
}

bool CountingSemaphore::take_for(uint32_t timeout_ms) {
    if (timeout_ms == MAX_TIMEOUT) {
        take();
        return true;
    }

    const timespec deadline = deadline_after(CLOCK_MONOTONIC, timeout_ms);
    while (sem_clockwait(&handle_->sem, CLOCK_MONOTONIC, &deadline) != 0) {
        if (errno == EINTR) continue;
        if (errno != ETIMEDOUT) {
            std::cerr << "[CountingSemaphore] sem_clockwait failed errno=" << errno << "\n";
        }
        return false;
    }
    return true;
}

void CountingSemaphore::give() {
    int val;
    sem_getvalue(&handle_->sem, &val);

    if (static_cast<unsigned>(val) < handle_->maxCount) {
        sem_post(&handle_->sem);
    } else {
        std::cerr << "[CountingSemaphore] give() called when full\n";
    }
}
}  // namespace Rtos
