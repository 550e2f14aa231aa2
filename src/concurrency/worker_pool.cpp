#include "dsync/concurrency/worker_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace dsync::concurrency {

WorkerPool::WorkerPool(std::size_t workers) {
    const auto count = std::max<std::size_t>(1, workers);
    threads_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        threads_.emplace_back([this, i]() { worker_loop(i); });
    }
}

WorkerPool::~WorkerPool() {
    wait();
}

bool WorkerPool::submit(Job job) {
    return jobs_.push(std::move(job));
}

void WorkerPool::wait() {
    jobs_.close();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void WorkerPool::worker_loop(std::size_t index) {
    while (auto job = jobs_.pop()) {
        try {
            (*job)();
        } catch (const std::exception& e) {
            spdlog::error("[Worker {}] job threw: {}", index, e.what());
        }
    }
    spdlog::trace("[Worker {}] queue drained", index);
}

} // namespace dsync::concurrency
