#include "dsync/sync/session.hpp"

#include <algorithm>
#include <map>
#include <vector>

namespace dsync::sync {
namespace {

bool is_progressive(RunState current, RunState target) {
    static const std::map<RunState, std::vector<RunState>> transitions {
        {RunState::Idle, {RunState::Scanning}},
        {RunState::Scanning, {RunState::Transferring, RunState::Cancelled}},
        {RunState::Transferring, {RunState::Complete, RunState::Cancelled}},
    };

    if (target == RunState::Failed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

} // namespace

std::string to_string(RunState state) {
    switch (state) {
        case RunState::Idle: return "idle";
        case RunState::Scanning: return "scanning";
        case RunState::Transferring: return "transferring";
        case RunState::Complete: return "complete";
        case RunState::Cancelled: return "cancelled";
        case RunState::Failed: return "failed";
    }
    return "unknown";
}

SyncRun::SyncRun(std::string task_name) {
    info_.task_name = std::move(task_name);
}

bool SyncRun::is_terminal() const noexcept {
    return info_.state == RunState::Complete || info_.state == RunState::Cancelled ||
           info_.state == RunState::Failed;
}

Result<void> SyncRun::start() {
    if (info_.state != RunState::Idle) {
        return Err<void>(ErrorKind::Configuration, "run for task '" + info_.task_name + "' already started");
    }
    info_.started_at = std::chrono::system_clock::now();
    started_steady_ = std::chrono::steady_clock::now();
    started_ = true;
    return transition_to(RunState::Scanning);
}

Result<void> SyncRun::transition_to(RunState next_state) {
    if (info_.state == next_state) {
        return Ok();
    }
    if (!can_transition(next_state)) {
        return Err<void>(ErrorKind::Configuration,
                         "illegal run transition " + to_string(info_.state) + " -> " + to_string(next_state));
    }
    info_.state = next_state;
    if (next_state != RunState::Failed) {
        info_.last_error.clear();
    }
    return Ok();
}

Result<void> SyncRun::mark_failed(std::string error_message) {
    auto moved = transition_to(RunState::Failed);
    if (moved.is_ok()) {
        info_.last_error = std::move(error_message);
    }
    return moved;
}

std::chrono::milliseconds SyncRun::elapsed() const {
    if (!started_) {
        return std::chrono::milliseconds{0};
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_steady_);
}

bool SyncRun::can_transition(RunState target) const noexcept {
    if (info_.state == target) {
        return true;
    }
    if (is_terminal()) {
        return false;
    }
    return is_progressive(info_.state, target);
}

} // namespace dsync::sync
