#pragma once

/// @file include/qmj/worker_pool.hpp
/// @brief WorkerPool: scoped set of threads for period-parallel work.
///
/// Threads start in the constructor and are joined in the destructor, so a
/// pool lives exactly as long as the scope that owns it. A pool of one
/// worker starts no thread and runs tasks on the calling thread.

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace qmj::engine {

class WorkerPool {
public:
    /// `workers` is clamped to at least 1.
    ///
    /// # Throws
    /// std::system_error or std::bad_alloc if a thread cannot be started.
    /// Threads started before the failure are stopped and joined first.
    explicit WorkerPool(std::size_t workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&)            = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Run `task(i)` for every i in [0, n) and wait for all of them.
    ///
    /// Indices are handed out in increasing order to whichever worker is free,
    /// so completion order is unspecified. If tasks throw, every index still
    /// runs and the first captured exception is rethrown here.
    void for_each_index(std::size_t n,
                        const std::function<void(std::size_t)>& task);

    [[nodiscard]] std::size_t workers() const noexcept { return workers_; }

private:
    void worker_loop();
    void stop_and_join() noexcept;

    std::size_t              workers_;
    std::vector<std::thread> threads_;

    std::mutex              mu_;
    std::condition_variable work_cv_;
    std::condition_variable done_cv_;

    const std::function<void(std::size_t)>* task_ = nullptr;
    std::size_t        next_     = 0;
    std::size_t        count_    = 0;
    std::size_t        finished_ = 0;
    bool               stop_     = false;
    std::exception_ptr error_;
};

} // namespace qmj::engine
