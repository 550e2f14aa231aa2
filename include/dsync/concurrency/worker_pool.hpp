#pragma once

#include "dsync/concurrency/thread_safe_queue.hpp"

#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

namespace dsync::concurrency {

/**
 * @brief Fixed number of threads draining a job queue
 *
 * At most size() jobs run at once. wait() closes the queue, lets the
 * workers finish everything already submitted, and joins them. The pool
 * is single-use: nothing can be submitted after wait().
 */
class WorkerPool {
public:
    using Job = std::function<void()>;

    /**
     * @param workers clamped to at least 1
     */
    explicit WorkerPool(std::size_t workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @return false once wait() has been called
     */
    bool submit(Job job);

    void wait();

    std::size_t size() const noexcept { return threads_.size(); }

private:
    void worker_loop(std::size_t index);

    ThreadSafeQueue<Job> jobs_;
    std::vector<std::thread> threads_;
};

} // namespace dsync::concurrency
