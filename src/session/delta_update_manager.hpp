#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include "core/config/manager_config.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/delta_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/delta_snapshot.hpp"
#include "protocol/operation_contract.hpp"
#include "runtime/operation_executor.hpp"
#include "session/session.hpp"
#include "session/session_reaper.hpp"
#include "session/session_registry.hpp"

namespace xcdelta::session {

// Starts operations under session identifiers and serves incremental deltas of
// their results to any number of pollers.
//
// Fragment is the result type an operation reports; Request is passed opaquely
// to the OperationProvider that turns it into an operation.
template <typename Fragment, typename Request>
class DeltaUpdateManager {
public:
    using Snapshot = protocol::DeltaSnapshot<Fragment>;
    using Provider = protocol::OperationProvider<Fragment, Request>;
    using SessionPtr = typename SessionRegistry<Fragment>::SessionPtr;
    using OperationPtr = std::shared_ptr<protocol::Operation<Fragment>>;

    explicit DeltaUpdateManager(std::shared_ptr<Provider> provider,
                                core::config::ManagerConfig config = {})
        : provider_(std::move(provider)),
          config_(config),
          registry_(config.max_live_sessions),
          reaper_(config.reap_interval, [this]() { return sweep(); }) {
        reaper_.start();
    }

    DeltaUpdateManager(const DeltaUpdateManager&) = delete;
    DeltaUpdateManager& operator=(const DeltaUpdateManager&) = delete;

    ~DeltaUpdateManager() { shutdown(); }

    core::errors::Result<std::string> start_session(
        const Request& request,
        const std::optional<std::string>& session_id = std::nullopt) {
        if (!provider_) {
            return core::errors::DeltaError{core::errors::ErrorCategory::Internal,
                                            "No operation provider configured.",
                                            "missing_provider"};
        }
        if (session_id.has_value() &&
            !core::config::is_valid_session_id(session_id.value())) {
            return core::errors::DeltaError{
                core::errors::ErrorCategory::InvalidRequest,
                "Invalid session identifier: '" + session_id.value() + "'",
                "invalid_session_id",
                "Use 1-128 characters from [A-Za-z0-9._-]."};
        }

        auto validated = provider_->validate(request);
        if (core::errors::is_error(validated)) {
            const auto& err = core::errors::get_error(validated);
            XCDELTA_LOG_WARN("DeltaUpdateManager: rejected request [" + err.code +
                             "]: " + err.message);
            return err;
        }

        if (session_id.has_value()) {
            return create_session(session_id.value(), request);
        }

        constexpr int kMaxAttempts = 16;
        for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
            auto created =
                create_session(core::config::generate_session_id(), request);
            if (core::errors::is_error(created) &&
                core::errors::get_error(created).category ==
                    core::errors::ErrorCategory::AlreadyExists) {
                continue;
            }
            return created;
        }
        return core::errors::DeltaError{core::errors::ErrorCategory::Internal,
                                        "Unable to allocate unique session ID.",
                                        "session_id_generation_failed"};
    }

    core::errors::Result<Snapshot> poll(const std::string& session_id,
                                        const protocol::DeltaCursor& since = {}) const {
        auto found = registry_.get(session_id);
        if (core::errors::is_error(found)) {
            return core::errors::get_error(found);
        }
        return core::errors::get_value(found)->snapshot(since);
    }

    // Cooperative: signals the operation and returns the state observed right
    // after. The session becomes Cancelled once the operation acknowledges.
    core::errors::Result<protocol::SessionState> terminate(const std::string& session_id) {
        auto found = registry_.get(session_id);
        if (core::errors::is_error(found)) {
            return core::errors::get_error(found);
        }
        const auto& session = core::errors::get_value(found);
        if (session->request_cancel()) {
            XCDELTA_LOG_INFO("DeltaUpdateManager: cancellation requested for " +
                             session_id);
        }
        return session->state();
    }

    // Enforces the lifetime limit, then drops terminal sessions past retention.
    std::size_t sweep(Clock::time_point now = Clock::now()) {
        if (config_.max_session_lifetime.count() > 0) {
            for (const auto& id :
                 registry_.list_live_older_than(config_.max_session_lifetime, now)) {
                XCDELTA_LOG_WARN("DeltaUpdateManager: session " + id +
                                 " exceeded its maximum lifetime");
                auto terminated = terminate(id);
                if (core::errors::is_error(terminated)) {
                    XCDELTA_LOG_DEBUG("DeltaUpdateManager: " +
                                      core::errors::get_error(terminated).message);
                }
            }
        }

        std::size_t removed = 0;
        for (const auto& id : registry_.list_terminal_older_than(config_.retention, now)) {
            if (registry_.remove(id)) {
                XCDELTA_LOG_INFO("DeltaUpdateManager: reaped session " + id);
                ++removed;
            }
        }
        return removed;
    }

    // Stops the reaper, cancels live sessions and joins operation threads.
    void shutdown() {
        reaper_.stop();
        for (const auto& session : registry_.live_sessions()) {
            session->request_cancel();
        }
        const std::size_t active = executor_.active_count();
        if (active > 0) {
            XCDELTA_LOG_DEBUG("DeltaUpdateManager: waiting for " + std::to_string(active) +
                              " operations to stop");
        }
        executor_.stop();
    }

    std::size_t session_count() const { return registry_.size(); }
    std::size_t live_session_count() const { return registry_.live_count(); }
    const core::config::ManagerConfig& config() const { return config_; }

private:
    core::errors::Result<std::string> create_session(const std::string& session_id,
                                                     const Request& request) {
        auto created = registry_.create(
            session_id,
            [this, &session_id, &request](const SessionPtr& session)
                -> core::errors::Result<bool> {
                auto made = provider_->make_operation(session_id, request);
                if (core::errors::is_error(made)) {
                    return core::errors::get_error(made);
                }
                OperationPtr operation = core::errors::get_value(made);
                if (!operation) {
                    return core::errors::DeltaError{
                        core::errors::ErrorCategory::Internal,
                        "Provider returned no operation.", "missing_operation"};
                }
                session->attach(operation);
                return executor_.submit(
                    [session, operation]() { run_operation(session, operation); });
            });
        if (core::errors::is_error(created)) {
            const auto& err = core::errors::get_error(created);
            XCDELTA_LOG_WARN("DeltaUpdateManager: failed to create " + session_id +
                             " [" + err.code + "]: " + err.message);
            return err;
        }
        XCDELTA_LOG_INFO("DeltaUpdateManager: session started: " + session_id);
        return session_id;
    }

    // Body of the operation thread.
    static void run_operation(const SessionPtr& session, const OperationPtr& operation) {
        if (session->cancel_requested()) {
            session->finish(protocol::OperationOutcome{
                protocol::OperationStatus::Cancelled, std::nullopt});
            return;
        }

        protocol::OperationOutcome outcome;
        try {
            outcome = operation->run(*session);
        } catch (const std::exception& ex) {
            outcome = protocol::OperationOutcome{
                protocol::OperationStatus::Failed,
                core::errors::DeltaError{core::errors::ErrorCategory::OperationFailed,
                                         std::string("Operation threw: ") + ex.what(),
                                         "operation_exception"}};
        } catch (...) {
            outcome = protocol::OperationOutcome{
                protocol::OperationStatus::Failed,
                core::errors::DeltaError{core::errors::ErrorCategory::OperationFailed,
                                         "Operation threw a non-standard exception.",
                                         "operation_exception"}};
        }

        if (outcome.error.has_value()) {
            XCDELTA_LOG_ERROR("Session " + session->identifier() + " failed [" +
                              outcome.error->code + "]: " + outcome.error->message);
        }
        session->finish(outcome);
    }

    std::shared_ptr<Provider> provider_;
    const core::config::ManagerConfig config_;
    SessionRegistry<Fragment> registry_;
    runtime::OperationExecutor executor_;
    SessionReaper reaper_;
};

}  // namespace xcdelta::session
