//! # Worker Pool
//!
//! Fixed set of threads executing submitted jobs from an unbounded queue.
//! The thread count is the only cap on how many jobs run at once; submission
//! never blocks.
//!
//! | Operation    | Effect                                                  |
//! |--------------|---------------------------------------------------------|
//! | `submit`     | Queue a job; ignored after `cancel`                     |
//! | `cancel`     | Drop queued jobs; running jobs finish                   |
//! | `~WorkerPool`| Run what is still queued (unless cancelled), then join  |

#ifndef LOOM_BUILD_WORKER_POOL_HPP
#define LOOM_BUILD_WORKER_POOL_HPP

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace loom::build {

class WorkerPool {
public:
    /// `num_threads == 0` uses the hardware concurrency.
    explicit WorkerPool(unsigned num_threads = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    auto operator=(const WorkerPool&) -> WorkerPool& = delete;

    /// Returns false if the pool was cancelled and the job was dropped.
    auto submit(std::function<void()> job) -> bool;

    void cancel();

    [[nodiscard]] auto thread_count() const -> unsigned {
        return static_cast<unsigned>(workers_.size());
    }

    [[nodiscard]] static auto default_thread_count() -> unsigned;

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> jobs_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
    bool cancelled_ = false;

    void worker_loop();
};

} // namespace loom::build

#endif // LOOM_BUILD_WORKER_POOL_HPP
