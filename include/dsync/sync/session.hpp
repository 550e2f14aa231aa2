#pragma once

#include "dsync/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace dsync::sync {

/**
 * @brief Lifecycle of one sync run
 *
 * Idle → Scanning → Transferring → Complete
 *                               → Cancelled
 * Scanning → Cancelled
 * any non-terminal → Failed
 */
enum class RunState {
    Idle,
    Scanning,
    Transferring,
    Complete,
    Cancelled,
    Failed
};

std::string to_string(RunState state);

struct SyncRunInfo {
    std::string task_name;
    RunState state = RunState::Idle;
    std::chrono::system_clock::time_point started_at{};
    std::size_t files_pending = 0;
    std::string last_error;  ///< Populated when state == Failed
};

class SyncRun {
public:
    explicit SyncRun(std::string task_name);

    const std::string& task_name() const noexcept { return info_.task_name; }
    RunState state() const noexcept { return info_.state; }
    const SyncRunInfo& info() const noexcept { return info_; }

    bool is_terminal() const noexcept;

    Result<void> start();
    Result<void> transition_to(RunState next_state);
    Result<void> mark_failed(std::string error_message);

    void set_pending(std::size_t files_pending) { info_.files_pending = files_pending; }

    /**
     * Time since start(), zero before it
     */
    std::chrono::milliseconds elapsed() const;

private:
    bool can_transition(RunState target) const noexcept;

    SyncRunInfo info_;
    std::chrono::steady_clock::time_point started_steady_{};
    bool started_ = false;
};

} // namespace dsync::sync
