#include "os/rtos.hpp"
#include <pthread.h>
#include <unistd.h>   // for usleep
#include <iostream>   // for std::cerr
#include <semaphore.h>
#include <cerrno>
#include <ctime>

namespace Rtos {

// Sleep utility
void SleepMs(int ms) {
    if (ms <= 0) return;
    usleep(static_cast<useconds_t>(ms) * 1000);  // Convert ms to microseconds
}

uint64_t NowUs() {
    timespec ts{};
    ::clock_gettime(CLOCK_MONOTONIC, &ts);
    return uint64_t(ts.tv_sec) * 1000000ull + uint64_t(ts.tv_nsec) / 1000ull;
}

namespace {

// Absolute CLOCK_REALTIME deadline timeout_ms from now (sem_timedwait and
// pthread_timedjoin_np both take realtime deadlines).
timespec deadlineFromNow(uint32_t timeout_ms) {
    timespec ts{};
    ::clock_gettime(CLOCK_REALTIME, &ts);
    ts.tv_sec  += timeout_ms / 1000;
    ts.tv_nsec += long(timeout_ms % 1000) * 1000000L;
    if (ts.tv_nsec >= 1000000000L) {
        ts.tv_sec  += 1;
        ts.tv_nsec -= 1000000000L;
    }
    return ts;
}

} // anonymous namespace

// =======================
// Task Implementation
// =======================

// Wrapper to convert function pointer to pthread-style
struct ThreadArgs {
    void (*fn)(void*);
    void* arg;
};

// Static thread entry point
void* threadEntryPoint(void* ptr) {
    ThreadArgs* args = static_cast<ThreadArgs*>(ptr);
    args->fn(args->arg);
    delete args;
    return nullptr;
}

// Platform-specific handle
struct Task::TaskHandle {
    pthread_t thread;
    bool created = false;
    bool joined = false;
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
    if (handle_->created && !handle_->joined) {
        std::cerr << "[RTOS] Task " << (name ? name : "?") << " already running\n";
        return false;
    }

    auto* args = new ThreadArgs{fn, arg};

    const int rc = pthread_create(&handle_->thread, nullptr, threadEntryPoint, args);
    if (rc != 0) {
        std::cerr << "[RTOS] Failed to create task " << (name ? name : "?")
                  << " rc=" << rc << "\n";
        delete args;
        return false;
    }

    handle_->created = true;
    handle_->joined  = false;
    if (name) {
        // Linux limits thread names to 15 chars + NUL; longer names are ignored.
        (void)pthread_setname_np(handle_->thread, name);
    }
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

    const timespec deadline = deadlineFromNow(timeout_ms);
    const int rc = pthread_timedjoin_np(handle_->thread, nullptr, &deadline);
    if (rc == 0) {
        handle_->joined = true;
        return true;
    }
    return false;
}

bool Task::Running() const {
    return handle_ && handle_->created && !handle_->joined;
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

bool CountingSemaphore::take(uint32_t timeout_ms) {
    const timespec deadline = deadlineFromNow(timeout_ms);
    while (sem_timedwait(&handle_->sem, &deadline) != 0) {
        if (errno == EINTR) continue;
        if (errno != ETIMEDOUT) {
            std::cerr << "[CountingSemaphore] sem_timedwait failed errno=" << errno << "\n";
        }
        return false;
    }
    return true;
}

bool CountingSemaphore::try_take() {
    return (sem_trywait(&handle_->sem) == 0);
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
