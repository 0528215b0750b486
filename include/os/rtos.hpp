#pragma once
#include <cstddef> // Required for size_t
#include <cstdint>
#include <utility>

namespace Rtos {

// Wait "forever" (receivers still observe close()).
static constexpr uint32_t MAX_TIMEOUT = 0xFFFFFFFFu;

void SleepMs(int ms);

// Monotonic clock in microseconds.
uint64_t NowUs();

//== Task abstraction ==//
// This class provides a simple task wrapper
class Task {
public:
    Task();
    ~Task();

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    bool Create(const char* name, void (*fn)(void*), void* arg);
    void Join();

    // Join with an upper bound. Returns false if the task is still running
    // after timeout_ms; the task is then left to finish on its own.
    bool JoinFor(uint32_t timeout_ms);

    bool Running() const;

private:
    struct TaskHandle;
    TaskHandle* handle_;
};

//== Mutex abstraction ==//
// This class provides a simple mutex wrapper

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

    void take();                        // block until count>0, then --count
    bool take(uint32_t timeout_ms);     // as take(), false on timeout
    bool try_take();                    // non‐blocking: if count>0 then --count, else false
    void give();                        // ++count, wake one waiter if present

private:
    struct CountingSemHandle;
    CountingSemHandle* handle_;
};

//== Queue abstraction ==//
// Fixed-size statically allocated queue
//
// Circular buffer synchronised with the OSAL Mutex and two CountingSemaphores
// (free slots / filled slots).
//
// Backpressure policy is chosen by the caller:
//  - send()     blocks until a slot frees up (or timeout)
//  - try_send() never blocks; when full the NEW item is dropped and
//               already-buffered items are kept
//
// Lifecycle: open -> closed. After close() every send fails, receivers keep
// draining what is buffered and then observe closed+empty as end-of-stream.
// Blocked receivers re-check the closed flag every CLOSE_POLL_MS.
//
template <typename T, size_t Capacity>
class Queue {
    static_assert(Capacity > 0, "Queue capacity must be non-zero");

public:
    static constexpr uint32_t CLOSE_POLL_MS = 50;

    Queue() : head(0), tail(0), count(0), closed(false) {}

    Queue(const Queue&) = delete;
    Queue& operator=(const Queue&) = delete;

    bool send(const T& item, uint32_t timeout_ms = MAX_TIMEOUT) {
        if (isClosed()) return false;
        if (!waitFor(spaceAvailable, timeout_ms)) return false;
        return push(item);
    }

    bool try_send(const T& item) {
        if (isClosed()) return false;
        if (!spaceAvailable.try_take()) return false;
        return push(item);
    }

    bool receive(T& item, uint32_t timeout_ms = MAX_TIMEOUT) {
        if (!waitFor(dataAvailable, timeout_ms)) return false;
        pop(item);
        return true;
    }

    bool try_receive(T& item) {
        if (!dataAvailable.try_take()) return false;
        pop(item);
        return true;
    }

    void close() {
        lock.lock();
        closed = true;
        lock.unlock();
    }

    bool isClosed() {
        lock.lock();
        const bool c = closed;
        lock.unlock();
        return c;
    }

    size_t size() {
        lock.lock();
        const size_t n = count;
        lock.unlock();
        return n;
    }

    static constexpr size_t capacity() { return Capacity; }

private:
    // Wait on sem in CLOSE_POLL_MS slices so close() is noticed. Once closed,
    // a failed slice means no more items can arrive.
    bool waitFor(CountingSemaphore& sem, uint32_t timeout_ms) {
        if (sem.try_take()) return true;
        if (timeout_ms == 0) return false;

        const uint64_t start_us = NowUs();
        while (true) {
            uint32_t slice = CLOSE_POLL_MS;
            if (timeout_ms != MAX_TIMEOUT) {
                const uint64_t elapsed_ms = (NowUs() - start_us) / 1000ull;
                if (elapsed_ms >= timeout_ms) return false;
                const uint64_t left = timeout_ms - elapsed_ms;
                if (left < slice) slice = static_cast<uint32_t>(left);
            }
            if (sem.take(slice)) return true;
            if (isClosed()) return sem.try_take();
        }
    }

    bool push(const T& item) {
        lock.lock();
        if (closed) {
            lock.unlock();
            spaceAvailable.give();  // hand the slot back
            return false;
        }
        buffer[head] = item;
        head = (head + 1) % Capacity;
        ++count;
        lock.unlock();
        dataAvailable.give();   // Signal data is available
        return true;
    }

    void pop(T& item) {
        lock.lock();
        item = std::move(buffer[tail]);
        buffer[tail] = T{};
        tail = (tail + 1) % Capacity;
        --count;
        lock.unlock();
        spaceAvailable.give(); // Signal space is available
    }

    T buffer[Capacity];
    size_t head, tail, count;
    bool closed;

    Mutex lock;
    CountingSemaphore spaceAvailable{Capacity, Capacity};  // Initially full space
    CountingSemaphore dataAvailable{Capacity, 0};          // Initially no data
};
} // namespace Rtos
