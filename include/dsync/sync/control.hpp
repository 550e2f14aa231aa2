#pragma once

/**
 * @file control.hpp
 * @brief Cooperative pause/cancel shared by every worker of one run
 *
 * Passed explicitly into each call that may block; there is no global
 * instance. Two stop levels, both sticky for the lifetime of the object:
 * - cancel: files not yet started are skipped; transfers already running
 *   finish (success or failure) and are counted
 * - abort: running transfers also stop at their next chunk boundary,
 *   keeping the bytes written so far; implies cancel
 * Pause can be toggled; a paused worker keeps its slot and its open
 * connection. A cancel releases paused transfers so they can finish.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace dsync::sync {

class TransferControl {
public:
    explicit TransferControl(std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500))
        : poll_interval_(poll_interval) {}

    TransferControl(const TransferControl&) = delete;
    TransferControl& operator=(const TransferControl&) = delete;

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.store(true);
        }
        wake_.notify_all();
    }

    void abort() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            aborted_.store(true);
            cancelled_.store(true);
        }
        wake_.notify_all();
    }

    void pause() { paused_.store(true); }

    void resume() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            paused_.store(false);
        }
        wake_.notify_all();
    }

    bool is_cancelled() const noexcept { return cancelled_.load(); }
    bool is_aborted() const noexcept { return aborted_.load(); }
    bool is_paused() const noexcept { return paused_.load(); }

    std::chrono::milliseconds poll_interval() const noexcept { return poll_interval_; }

    /**
     * @brief Block a worker that has not started its file yet
     *
     * @return false when cancelled (while paused or before)
     */
    bool wait_while_paused() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (paused_.load() && !cancelled_.load()) {
            wake_.wait_for(lock, poll_interval_);
        }
        return !cancelled_.load();
    }

    /**
     * @brief Block a running transfer between chunks while paused
     *
     * Returns once resumed, cancelled or aborted.
     * @return false when aborted
     */
    bool hold_while_paused() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (paused_.load() && !cancelled_.load()) {
            wake_.wait_for(lock, poll_interval_);
        }
        return !aborted_.load();
    }

    /**
     * @brief Sleep for a backoff or throttle interval, waking early on abort
     *
     * @return false when aborted
     */
    template<typename Rep, typename Period>
    bool sleep_for(const std::chrono::duration<Rep, Period>& duration) {
        std::unique_lock<std::mutex> lock(mutex_);
        wake_.wait_for(lock, duration, [this]() { return aborted_.load(); });
        return !aborted_.load();
    }

private:
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> aborted_{false};
    std::atomic<bool> paused_{false};
    std::chrono::milliseconds poll_interval_;
    std::mutex mutex_;
    std::condition_variable wake_;
};

} // namespace dsync::sync
