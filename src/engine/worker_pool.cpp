/// @file src/engine/worker_pool.cpp
/// @brief WorkerPool: fixed threads draining an index range.

#include "qmj/worker_pool.hpp"

#include <algorithm>
#include <utility>

namespace qmj::engine {

WorkerPool::WorkerPool(std::size_t workers)
    : workers_(std::max<std::size_t>(workers, 1))
{
    // A single worker runs inline on the caller's thread.
    if (workers_ > 1) {
        threads_.reserve(workers_);
        try {
            for (std::size_t i = 0; i < workers_; ++i) {
                threads_.emplace_back([this] { worker_loop(); });
            }
        } catch (...) {
            // The destructor will not run; join whatever already started.
            stop_and_join();
            throw;
        }
    }
}

WorkerPool::~WorkerPool() {
    stop_and_join();
}

void WorkerPool::stop_and_join() noexcept {
    {
        std::lock_guard<std::mutex> lock(mu_);
        stop_ = true;
    }
    work_cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    threads_.clear();
}

void WorkerPool::worker_loop() {
    std::unique_lock<std::mutex> lock(mu_);
    for (;;) {
        work_cv_.wait(lock, [this] { return stop_ || next_ < count_; });
        if (next_ >= count_) {
            return;  // stop_ set and no work pending
        }
        const std::size_t index = next_++;
        const auto* task = task_;
        lock.unlock();

        std::exception_ptr err;
        try {
            (*task)(index);
        } catch (...) {
            err = std::current_exception();
        }

        lock.lock();
        if (err && !error_) {
            error_ = err;
        }
        if (++finished_ == count_) {
            done_cv_.notify_all();
        }
    }
}

void WorkerPool::for_each_index(std::size_t n,
                                const std::function<void(std::size_t)>& task) {
    if (n == 0) {
        return;
    }
    if (threads_.empty()) {
        std::exception_ptr first;
        for (std::size_t i = 0; i < n; ++i) {
            try {
                task(i);
            } catch (...) {
                if (!first) first = std::current_exception();
            }
        }
        if (first) {
            std::rethrow_exception(first);
        }
        return;
    }

    std::unique_lock<std::mutex> lock(mu_);
    task_     = &task;
    next_     = 0;
    count_    = n;
    finished_ = 0;
    error_    = nullptr;
    work_cv_.notify_all();

    done_cv_.wait(lock, [this] { return finished_ == count_; });

    task_  = nullptr;
    next_  = 0;
    count_ = 0;
    std::exception_ptr err = std::exchange(error_, nullptr);
    lock.unlock();

    if (err) {
        std::rethrow_exception(err);
    }
}

} // namespace qmj::engine
