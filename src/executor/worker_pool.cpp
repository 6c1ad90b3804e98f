/**
 * @file worker_pool.cpp
 * @brief WorkerPool implementation.
 */

#include "executor/worker_pool.hpp"

namespace autotune {

WorkerPool::WorkerPool(size_t num_threads) {
    if (num_threads == 0) num_threads = 1;

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

WorkerPool::~WorkerPool() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    job_cv_.notify_all();
    // jthreads join in their destructors
}

void WorkerPool::post(std::function<void()> job) {
    {
        std::lock_guard lock(mutex_);
        jobs_.push(std::move(job));
    }
    job_cv_.notify_one();
}

void WorkerPool::wait_idle() {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this] {
        return jobs_.empty() && active_jobs_.load() == 0;
    });
}

void WorkerPool::worker_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        std::function<void()> job;
        {
            std::unique_lock lock(mutex_);
            job_cv_.wait(lock, stop, [this] { return !jobs_.empty(); });
            if (jobs_.empty()) continue;

            job = std::move(jobs_.front());
            jobs_.pop();
            ++active_jobs_;
        }

        job();

        {
            std::lock_guard lock(mutex_);
            --active_jobs_;
        }
        idle_cv_.notify_all();
    }
}

size_t WorkerPool::active_count() const noexcept {
    return active_jobs_.load();
}

size_t WorkerPool::queued_count() const {
    std::lock_guard lock(mutex_);
    return jobs_.size();
}

size_t WorkerPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace autotune
