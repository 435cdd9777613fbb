#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include "core/config/manager_config.hpp"
#include "core/errors/delta_errors.hpp"
#include "protocol/operation_contract.hpp"
#include "protocol/test_run_request.hpp"
#include "protocol/test_run_update.hpp"
#include "session/delta_update_manager.hpp"
#include "target/bundle_storage.hpp"
#include "target/target.hpp"

namespace xcdelta::runtime {

// Runs one test bundle on a target and streams its results into a session.
class XCTestOperation : public protocol::Operation<protocol::TestRunUpdate> {
public:
    XCTestOperation(std::string session_id, protocol::XCTestRunRequest request,
                    std::shared_ptr<const target::Target> target,
                    std::shared_ptr<const target::BundleStorage> bundle_storage,
                    std::filesystem::path work_root);

    protocol::OperationOutcome run(
        protocol::OperationSink<protocol::TestRunUpdate>& sink) override;
    void cancel() override;

private:
    std::string session_id_;
    protocol::XCTestRunRequest request_;
    std::shared_ptr<const target::Target> target_;
    std::shared_ptr<const target::BundleStorage> bundle_storage_;
    std::filesystem::path work_root_;
    std::shared_ptr<std::atomic_bool> cancel_token_;
};

class XCTestOperationProvider
    : public protocol::OperationProvider<protocol::TestRunUpdate,
                                         protocol::XCTestRunRequest> {
public:
    XCTestOperationProvider(std::shared_ptr<const target::Target> target,
                            std::shared_ptr<const target::BundleStorage> bundle_storage,
                            std::filesystem::path work_root);

    core::errors::Result<bool> validate(
        const protocol::XCTestRunRequest& request) const override;

    core::errors::Result<std::shared_ptr<protocol::Operation<protocol::TestRunUpdate>>>
    make_operation(const std::string& session_id,
                   const protocol::XCTestRunRequest& request) override;

private:
    std::shared_ptr<const target::Target> target_;
    std::shared_ptr<const target::BundleStorage> bundle_storage_;
    std::filesystem::path work_root_;
};

using XCTestDeltaUpdateManager =
    session::DeltaUpdateManager<protocol::TestRunUpdate, protocol::XCTestRunRequest>;
using XCTestDelta = XCTestDeltaUpdateManager::Snapshot;

// A delta update manager for XCTest execution. Each session gets its own
// working directory under work_root.
std::unique_ptr<XCTestDeltaUpdateManager> make_xctest_manager(
    std::shared_ptr<const target::Target> target,
    std::shared_ptr<const target::BundleStorage> bundle_storage,
    std::filesystem::path work_root, core::config::ManagerConfig config = {});

}  // namespace xcdelta::runtime
