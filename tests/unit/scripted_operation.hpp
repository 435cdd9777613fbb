#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "core/errors/delta_errors.hpp"
#include "protocol/delta_snapshot.hpp"
#include "protocol/operation_contract.hpp"

namespace xcdelta::testing {

// What a scripted operation does when it runs.
struct ScriptedRequest {
    std::vector<std::string> fragments;
    // Park after the fragments until cancelled.
    bool hold = false;
    bool fail = false;
    bool throws = false;
    bool invalid = false;
};

class ScriptedOperation : public protocol::Operation<std::string> {
public:
    ScriptedOperation(ScriptedRequest script, std::shared_ptr<std::atomic<int>> runs)
        : script_(std::move(script)), runs_(std::move(runs)) {}

    protocol::OperationOutcome run(protocol::OperationSink<std::string>& sink) override {
        runs_->fetch_add(1);
        for (const auto& fragment : script_.fragments) {
            sink.append_log("emit " + fragment + "\n");
            sink.append_fragment(fragment);
        }
        if (script_.throws) {
            throw std::runtime_error("scripted explosion");
        }
        if (script_.hold) {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return cancelled_; });
            return protocol::OperationOutcome{protocol::OperationStatus::Cancelled,
                                              std::nullopt};
        }
        if (script_.fail) {
            return protocol::OperationOutcome{
                protocol::OperationStatus::Failed,
                core::errors::DeltaError{core::errors::ErrorCategory::OperationFailed,
                                         "scripted failure", "scripted_failure"}};
        }
        return protocol::OperationOutcome{protocol::OperationStatus::Succeeded,
                                          std::nullopt};
    }

    void cancel() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool cancelled() {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

private:
    ScriptedRequest script_;
    std::shared_ptr<std::atomic<int>> runs_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
};

class ScriptedProvider
    : public protocol::OperationProvider<std::string, ScriptedRequest> {
public:
    core::errors::Result<bool> validate(const ScriptedRequest& request) const override {
        if (request.invalid) {
            return core::errors::DeltaError{core::errors::ErrorCategory::InvalidRequest,
                                            "scripted request rejected",
                                            "invalid_request"};
        }
        return true;
    }

    core::errors::Result<std::shared_ptr<protocol::Operation<std::string>>> make_operation(
        const std::string&, const ScriptedRequest& request) override {
        made.fetch_add(1);
        std::shared_ptr<protocol::Operation<std::string>> operation =
            std::make_shared<ScriptedOperation>(request, runs);
        return operation;
    }

    std::atomic<int> made{0};
    std::shared_ptr<std::atomic<int>> runs = std::make_shared<std::atomic<int>>(0);
};

// Polls until pred(snapshot) holds or the deadline passes.
template <typename Manager, typename Pred>
std::optional<typename Manager::Snapshot> wait_for(
    Manager& manager, const std::string& session_id, Pred pred,
    std::chrono::milliseconds deadline = std::chrono::milliseconds(5000)) {
    const auto until = std::chrono::steady_clock::now() + deadline;
    while (std::chrono::steady_clock::now() < until) {
        auto polled = manager.poll(session_id, protocol::DeltaCursor{});
        if (!core::errors::is_error(polled) && pred(core::errors::get_value(polled))) {
            return core::errors::get_value(polled);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return std::nullopt;
}

template <typename Manager>
std::optional<typename Manager::Snapshot> wait_for_terminal(Manager& manager,
                                                            const std::string& session_id) {
    return wait_for(manager, session_id, [](const typename Manager::Snapshot& delta) {
        return protocol::is_terminal(delta.state);
    });
}

}  // namespace xcdelta::testing
