#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "core/errors/delta_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/delta_snapshot.hpp"
#include "protocol/operation_contract.hpp"

namespace xcdelta::session {

using Clock = std::chrono::steady_clock;

// One tracked run of an operation. The operation thread writes through the
// OperationSink interface; pollers read through snapshot(). Both go through
// mutex_, so a snapshot never mixes a terminal state with a partial sequence.
template <typename Fragment>
class Session : public protocol::OperationSink<Fragment> {
public:
    Session(std::string identifier, Clock::time_point created_at)
        : identifier_(std::move(identifier)),
          created_at_(created_at),
          cancel_token_(std::make_shared<std::atomic_bool>(false)) {}

    const std::string& identifier() const { return identifier_; }
    Clock::time_point created_at() const { return created_at_; }
    std::shared_ptr<std::atomic_bool> cancel_token() const { return cancel_token_; }

    void attach(std::shared_ptr<protocol::Operation<Fragment>> operation) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (protocol::is_terminal(state_)) {
            return;
        }
        operation_ = std::move(operation);
    }

    bool mark_running() {
        std::lock_guard<std::mutex> lock(mutex_);
        return advance_locked(protocol::SessionState::Running);
    }

    void append_fragment(Fragment fragment) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (protocol::is_terminal(state_)) {
            XCDELTA_LOG_DEBUG("Session " + identifier_ +
                              ": dropping fragment after termination");
            return;
        }
        advance_locked(protocol::SessionState::Running);
        fragments_.push_back(std::move(fragment));
    }

    void append_log(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (protocol::is_terminal(state_)) {
            return;
        }
        log_.append(text);
    }

    void set_artifact_path(const std::string& path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (protocol::is_terminal(state_)) {
            return;
        }
        artifact_path_ = path;
    }

    // Sets the cancel flag and signals the operation. Returns false when the
    // session is already terminal.
    bool request_cancel() {
        std::shared_ptr<protocol::Operation<Fragment>> operation;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (protocol::is_terminal(state_)) {
                return false;
            }
            cancel_token_->store(true);
            operation = operation_;
        }
        // Signal outside the lock; cancel() may take its own locks.
        if (operation) {
            operation->cancel();
        }
        return true;
    }

    bool cancel_requested() const { return cancel_token_->load(); }

    // Records the operation's outcome and releases the operation handle.
    // Returns false when the session was already terminal.
    bool finish(const protocol::OperationOutcome& outcome,
                Clock::time_point now = Clock::now()) {
        std::shared_ptr<protocol::Operation<Fragment>> released;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (protocol::is_terminal(state_)) {
                return false;
            }

            protocol::SessionState next = protocol::SessionState::Completed;
            switch (outcome.status) {
                case protocol::OperationStatus::Succeeded:
                    next = protocol::SessionState::Completed;
                    break;
                case protocol::OperationStatus::Failed:
                    next = protocol::SessionState::Failed;
                    if (outcome.error.has_value()) {
                        error_ = outcome.error;
                    } else {
                        error_ = core::errors::DeltaError{
                            core::errors::ErrorCategory::OperationFailed,
                            "Operation failed without an error payload.",
                            "operation_failed"};
                    }
                    break;
                case protocol::OperationStatus::Cancelled:
                    next = protocol::SessionState::Cancelled;
                    break;
            }

            advance_locked(next);
            terminated_at_ = now;
            released = std::move(operation_);
        }
        return true;
    }

    protocol::DeltaSnapshot<Fragment> snapshot(const protocol::DeltaCursor& since) const {
        protocol::DeltaSnapshot<Fragment> delta;
        delta.identifier = identifier_;

        std::lock_guard<std::mutex> lock(mutex_);
        const std::size_t from = std::min(since.fragments, fragments_.size());
        delta.results.assign(fragments_.begin() + static_cast<std::ptrdiff_t>(from),
                             fragments_.end());
        const std::size_t log_from = std::min(since.log_offset, log_.size());
        delta.log_output = log_.substr(log_from);
        delta.state = state_;
        delta.error = error_;
        delta.artifact_path = artifact_path_;
        delta.next = protocol::DeltaCursor(fragments_.size(), log_.size());
        return delta;
    }

    protocol::SessionState state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    bool is_terminal() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return protocol::is_terminal(state_);
    }

    std::optional<Clock::time_point> terminated_at() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return terminated_at_;
    }

    std::size_t fragment_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fragments_.size();
    }

    bool has_operation() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return operation_ != nullptr;
    }

private:
    // Forward-only: Pending -> Running -> terminal, or Pending -> terminal.
    bool advance_locked(const protocol::SessionState next) {
        if (protocol::is_terminal(state_) || state_ == next) {
            return false;
        }
        if (next == protocol::SessionState::Pending) {
            return false;
        }
        XCDELTA_LOG_INFO("Session " + identifier_ + " transition " +
                         protocol::to_string(state_) + " -> " +
                         protocol::to_string(next));
        state_ = next;
        return true;
    }

    const std::string identifier_;
    const Clock::time_point created_at_;
    const std::shared_ptr<std::atomic_bool> cancel_token_;

    mutable std::mutex mutex_;
    protocol::SessionState state_ = protocol::SessionState::Pending;
    std::vector<Fragment> fragments_;
    std::string log_;
    std::optional<core::errors::DeltaError> error_;
    std::optional<std::string> artifact_path_;
    std::optional<Clock::time_point> terminated_at_;
    std::shared_ptr<protocol::Operation<Fragment>> operation_;
};

}  // namespace xcdelta::session
