#include "build/worker_pool.hpp"

#include "log/log.hpp"

namespace loom::build {

auto WorkerPool::default_thread_count() -> unsigned {
    unsigned n = std::thread::hardware_concurrency();
    return n == 0 ? 4 : n;
}

WorkerPool::WorkerPool(unsigned num_threads) {
    unsigned count = num_threads == 0 ? default_thread_count() : num_threads;
    workers_.reserve(count);
    for (unsigned i = 0; i < count; ++i)
        workers_.emplace_back(&WorkerPool::worker_loop, this);
    LOOM_LOG_DEBUG("build", "worker pool started with " << count << " threads");
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable())
            worker.join();
    }
}

auto WorkerPool::submit(std::function<void()> job) -> bool {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_)
            return false;
        jobs_.push(std::move(job));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        std::queue<std::function<void()>> empty;
        jobs_.swap(empty);
    }
    cv_.notify_all();
}

void WorkerPool::worker_loop() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !jobs_.empty() || stop_; });
            if (jobs_.empty())
                return; // stopped and drained
            job = std::move(jobs_.front());
            jobs_.pop();
        }
        job();
    }
}

} // namespace loom::build
