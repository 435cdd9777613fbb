#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors/delta_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/operation_contract.hpp"
#include "session/session.hpp"

namespace xcdelta::session {

// Identifier -> session map. All session creation goes through create(), which
// holds the exclusive lock across the duplicate check, the factory call and the
// insert.
template <typename Fragment>
class SessionRegistry {
public:
    using SessionPtr = std::shared_ptr<Session<Fragment>>;
    // Attaches and launches the operation for a freshly constructed session.
    using OperationFactory =
        std::function<core::errors::Result<bool>(const SessionPtr& session)>;

    explicit SessionRegistry(std::size_t max_live_sessions = 0)
        : max_live_sessions_(max_live_sessions) {}

    core::errors::Result<SessionPtr> create(const std::string& identifier,
                                            const OperationFactory& factory,
                                            Clock::time_point now = Clock::now()) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (sessions_.find(identifier) != sessions_.end()) {
            return core::errors::DeltaError{
                core::errors::ErrorCategory::AlreadyExists,
                "Session already exists: " + identifier, "already_exists"};
        }
        if (max_live_sessions_ > 0 && live_count_locked() >= max_live_sessions_) {
            return core::errors::DeltaError{
                core::errors::ErrorCategory::CapacityExceeded,
                "Cannot create session " + identifier + ": " +
                    std::to_string(max_live_sessions_) + " sessions already running.",
                "capacity_exceeded",
                "Terminate a running session or wait for one to finish."};
        }

        auto session = std::make_shared<Session<Fragment>>(identifier, now);
        auto started = factory(session);
        if (core::errors::is_error(started)) {
            return core::errors::get_error(started);
        }
        session->mark_running();
        sessions_.emplace(identifier, session);
        return session;
    }

    core::errors::Result<SessionPtr> get(const std::string& identifier) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = sessions_.find(identifier);
        if (it == sessions_.end()) {
            return not_found(identifier);
        }
        return it->second;
    }

    // No-op unless the session is terminal.
    bool remove(const std::string& identifier) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = sessions_.find(identifier);
        if (it == sessions_.end() || !it->second->is_terminal()) {
            return false;
        }
        sessions_.erase(it);
        return true;
    }

    std::vector<std::string> list_terminal_older_than(
        std::chrono::milliseconds age, Clock::time_point now = Clock::now()) const {
        std::vector<std::string> identifiers;
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& entry : sessions_) {
            const auto terminated_at = entry.second->terminated_at();
            if (terminated_at.has_value() && now - terminated_at.value() >= age) {
                identifiers.push_back(entry.first);
            }
        }
        return identifiers;
    }

    std::vector<std::string> list_live_older_than(
        std::chrono::milliseconds age, Clock::time_point now = Clock::now()) const {
        std::vector<std::string> identifiers;
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& entry : sessions_) {
            if (!entry.second->is_terminal() &&
                now - entry.second->created_at() >= age) {
                identifiers.push_back(entry.first);
            }
        }
        return identifiers;
    }

    std::vector<SessionPtr> live_sessions() const {
        std::vector<SessionPtr> live;
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& entry : sessions_) {
            if (!entry.second->is_terminal()) {
                live.push_back(entry.second);
            }
        }
        return live;
    }

    std::size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return sessions_.size();
    }

    std::size_t live_count() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return live_count_locked();
    }

    static core::errors::DeltaError not_found(const std::string& identifier) {
        return core::errors::DeltaError{core::errors::ErrorCategory::NotFound,
                                        "Session not found: " + identifier,
                                        "session_not_found"};
    }

private:
    std::size_t live_count_locked() const {
        std::size_t count = 0;
        for (const auto& entry : sessions_) {
            if (!entry.second->is_terminal()) {
                ++count;
            }
        }
        return count;
    }

    const std::size_t max_live_sessions_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, SessionPtr> sessions_;
};

}  // namespace xcdelta::session
