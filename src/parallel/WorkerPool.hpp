#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace axiom::parallel {

// "Run this later, independently of the caller" contract
class Dispatcher {
public:
    virtual ~Dispatcher() = default;

    // Queue a task and return immediately. The caller never observes the
    // task's outcome through this interface.
    virtual void submit(std::function<void()> task) = 0;
};

// Counters for benchmarking and tests
struct PoolMetrics {
    int num_threads = 0;
    long tasks_submitted = 0;
    long tasks_completed = 0;   // Including failed ones
    long tasks_failed = 0;      // Threw an exception
};

// Fixed-size pool of std::thread workers sharing one FIFO queue
//
// An exception escaping a task is logged and counted; the worker keeps going.
// The destructor stops accepting work, runs what is already queued, and joins.
class WorkerPool : public Dispatcher {
public:
    // num_threads <= 0 means hardware concurrency
    explicit WorkerPool(int num_threads = 0);
    ~WorkerPool() override;

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Throws std::runtime_error after shutdown()
    void submit(std::function<void()> task) override;

    // Block until the queue is empty and no task is running
    void wait_idle();

    // Finish queued work and join the workers. Idempotent.
    void shutdown();

    int num_threads() const { return static_cast<int>(threads_.size()); }

    PoolMetrics metrics() const;

private:
    void worker_loop();

    std::vector<std::thread> threads_;
    std::deque<std::function<void()>> queue_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;   // Signals queued work or stop
    std::condition_variable idle_cv_;   // Signals queue drained

    int active_ = 0;
    bool stopping_ = false;
    PoolMetrics metrics_;
};

} // namespace axiom::parallel
