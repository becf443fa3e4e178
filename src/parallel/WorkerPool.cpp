#include "WorkerPool.hpp"
#include "../core/Logging.hpp"

#include <exception>
#include <stdexcept>

namespace axiom::parallel {

WorkerPool::WorkerPool(int num_threads) {
    if (num_threads <= 0) {
        num_threads = static_cast<int>(std::thread::hardware_concurrency());
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    metrics_.num_threads = num_threads;
    threads_.reserve(static_cast<size_t>(num_threads));
    for (int t = 0; t < num_threads; ++t) {
        threads_.emplace_back(&WorkerPool::worker_loop, this);
    }

    logging::get_logger("axiom.pool")->debug("Started {} worker threads", num_threads);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("WorkerPool is shut down");
        }
        queue_.push_back(std::move(task));
        metrics_.tasks_submitted++;
    }
    work_cv_.notify_one();
}

void WorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && active_ == 0; });
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && threads_.empty()) return;
        stopping_ = true;
    }
    work_cv_.notify_all();

    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

PoolMetrics WorkerPool::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_;
}

void WorkerPool::worker_loop() {
    auto log = logging::get_logger("axiom.pool");

    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;  // stopping and drained
            }
            task = std::move(queue_.front());
            queue_.pop_front();
            active_++;
        }

        bool failed = false;
        try {
            task();
        } catch (const std::exception& e) {
            failed = true;
            log->error("Task failed: {}", e.what());
        } catch (...) {
            failed = true;
            log->error("Task failed with a non-standard exception");
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            active_--;
            metrics_.tasks_completed++;
            if (failed) metrics_.tasks_failed++;
            if (queue_.empty() && active_ == 0) {
                idle_cv_.notify_all();
            }
        }
    }
}

} // namespace axiom::parallel
