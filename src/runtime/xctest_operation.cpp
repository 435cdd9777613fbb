#include "runtime/xctest_operation.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/xctest_json.hpp"
#include "runtime/process_runner.hpp"
#include "runtime/result_bundle_writer.hpp"

namespace xcdelta::runtime {

using core::errors::DeltaError;
using core::errors::ErrorCategory;
using protocol::OperationOutcome;
using protocol::OperationStatus;
using protocol::TestMode;
using protocol::TestRunUpdate;
using protocol::XCTestRunRequest;

namespace {

constexpr std::uint32_t kMaxTimeoutSeconds = 86400;

DeltaError invalid_request(const std::string& message) {
    return DeltaError{ErrorCategory::InvalidRequest, message, "invalid_request"};
}

// Errors found while running surface through the session, not the caller.
OperationOutcome failed(DeltaError error) {
    error.category = ErrorCategory::OperationFailed;
    return OperationOutcome{OperationStatus::Failed, std::move(error)};
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.rfind(prefix, 0) == 0;
}

void record(const ResultBundleWriter* writer,
            const core::errors::Result<std::filesystem::path>& written) {
    if (writer != nullptr && core::errors::is_error(written)) {
        XCDELTA_LOG_WARN("Result bundle write failed [" +
                         core::errors::get_error(written).code +
                         "]: " + core::errors::get_error(written).message);
    }
}

}  // namespace

XCTestOperation::XCTestOperation(std::string session_id, XCTestRunRequest request,
                                 std::shared_ptr<const target::Target> target,
                                 std::shared_ptr<const target::BundleStorage> bundle_storage,
                                 std::filesystem::path work_root)
    : session_id_(std::move(session_id)),
      request_(std::move(request)),
      target_(std::move(target)),
      bundle_storage_(std::move(bundle_storage)),
      work_root_(std::move(work_root)),
      cancel_token_(std::make_shared<std::atomic_bool>(false)) {}

void XCTestOperation::cancel() {
    cancel_token_->store(true);
}

OperationOutcome XCTestOperation::run(protocol::OperationSink<TestRunUpdate>& sink) {
    if (cancel_token_->load()) {
        return OperationOutcome{OperationStatus::Cancelled, std::nullopt};
    }

    auto resolved = bundle_storage_->resolve(request_.test_bundle_id);
    if (core::errors::is_error(resolved)) {
        return failed(core::errors::get_error(resolved));
    }
    const target::TestBundle bundle = core::errors::get_value(resolved);

    const auto working_directory = work_root_ / session_id_;
    std::error_code ec;
    std::filesystem::create_directories(working_directory, ec);
    if (ec) {
        return failed(DeltaError{ErrorCategory::Internal,
                                 "Unable to create working directory: " +
                                     working_directory.string(),
                                 "working_directory_create_failed"});
    }

    std::optional<ResultBundleWriter> writer;
    if (request_.collect_result_bundle) {
        writer.emplace(session_id_, working_directory / "result_bundle.jsonl");
        const auto written = writer->write_request(request_);
        record(&writer.value(), written);
        if (!core::errors::is_error(written)) {
            sink.set_artifact_path(writer->path().string());
        }
    }
    const ResultBundleWriter* bundle_writer = writer.has_value() ? &writer.value() : nullptr;

    auto launch_result =
        target_->test_launch_configuration(request_, bundle, working_directory);
    if (core::errors::is_error(launch_result)) {
        return failed(core::errors::get_error(launch_result));
    }
    const auto& launch = core::errors::get_value(launch_result);

    if (request_.collect_logs) {
        sink.append_log("Running " + bundle.bundle_id + " (" +
                        protocol::to_string(request_.mode) + ") on " +
                        target_->identifier() + "\n");
    }

    ProcessSpec spec;
    spec.argv = launch.argv;
    spec.environment = launch.environment;
    spec.working_directory = launch.working_directory;
    spec.cancel_token = cancel_token_;
    if (request_.timeout_seconds.has_value()) {
        spec.timeout_ms =
            static_cast<std::uint64_t>(request_.timeout_seconds.value()) * 1000U;
    }

    const std::string prefix = protocol::kTestResultLinePrefix;
    std::size_t result_count = 0;
    const auto on_line = [&](OutputStream, const std::string& line) {
        if (starts_with(line, prefix)) {
            auto parsed = protocol::parse_test_update(line.substr(prefix.size()));
            if (!core::errors::is_error(parsed)) {
                TestRunUpdate update = core::errors::get_value(parsed);
                if (update.bundle_name.empty()) {
                    update.bundle_name = bundle.bundle_id;
                }
                if (bundle_writer != nullptr) {
                    record(bundle_writer, bundle_writer->write_result(update));
                }
                sink.append_fragment(std::move(update));
                ++result_count;
                return;
            }
            XCDELTA_LOG_WARN("Session " + session_id_ + ": " +
                             core::errors::get_error(parsed).message);
        }
        if (request_.collect_logs) {
            sink.append_log(line + "\n");
        }
    };

    ProcessRunner runner;
    auto exit_result = runner.run(spec, on_line);
    if (core::errors::is_error(exit_result)) {
        return failed(core::errors::get_error(exit_result));
    }
    const auto& exit = core::errors::get_value(exit_result);

    OperationOutcome outcome{OperationStatus::Succeeded, std::nullopt};
    std::string final_state = "completed";
    if (exit.cancelled) {
        outcome = OperationOutcome{OperationStatus::Cancelled, std::nullopt};
        final_state = "cancelled";
    } else if (exit.timed_out) {
        outcome = failed(DeltaError{
            ErrorCategory::OperationFailed,
            "Test execution exceeded " +
                std::to_string(request_.timeout_seconds.value_or(0)) + "s timeout.",
            "test_timeout"});
        final_state = "failed";
    } else if (exit.exit_code != 0) {
        outcome = failed(DeltaError{
            ErrorCategory::OperationFailed,
            "Test runner exited with code " + std::to_string(exit.exit_code) + ".",
            "test_runner_failed"});
        final_state = "failed";
    }

    XCDELTA_LOG_INFO("Session " + session_id_ + ": runner finished with " +
                     std::to_string(result_count) + " results in " +
                     std::to_string(static_cast<std::int64_t>(exit.duration_ms)) + "ms");

    if (bundle_writer != nullptr) {
        record(bundle_writer,
               bundle_writer->write_final(
                   final_state, outcome.error.has_value()
                                    ? std::optional<std::string>(outcome.error->message)
                                    : std::nullopt));
    }
    return outcome;
}

XCTestOperationProvider::XCTestOperationProvider(
    std::shared_ptr<const target::Target> target,
    std::shared_ptr<const target::BundleStorage> bundle_storage,
    std::filesystem::path work_root)
    : target_(std::move(target)),
      bundle_storage_(std::move(bundle_storage)),
      work_root_(std::move(work_root)) {}

core::errors::Result<bool> XCTestOperationProvider::validate(
    const XCTestRunRequest& request) const {
    if (request.test_bundle_id.empty()) {
        return invalid_request("Test run request must include a test bundle.");
    }
    if (request.mode == TestMode::Application && !request.app_bundle_id.has_value()) {
        return invalid_request("Application tests require an app bundle.");
    }
    if (request.mode == TestMode::UI &&
        (!request.app_bundle_id.has_value() ||
         !request.test_host_app_bundle_id.has_value())) {
        return invalid_request("UI tests require an app bundle and a test host bundle.");
    }
    if (request.timeout_seconds.has_value() &&
        (request.timeout_seconds.value() == 0 ||
         request.timeout_seconds.value() > kMaxTimeoutSeconds)) {
        return invalid_request("Test timeout must be between 1 and " +
                               std::to_string(kMaxTimeoutSeconds) + " seconds.");
    }
    for (const auto& test : request.tests_to_run) {
        if (std::find(request.tests_to_skip.begin(), request.tests_to_skip.end(),
                      test) != request.tests_to_skip.end()) {
            return invalid_request("Test is both selected and skipped: " + test);
        }
    }
    return true;
}

core::errors::Result<std::shared_ptr<protocol::Operation<TestRunUpdate>>>
XCTestOperationProvider::make_operation(const std::string& session_id,
                                        const XCTestRunRequest& request) {
    if (!target_ || !bundle_storage_) {
        return DeltaError{ErrorCategory::Internal,
                          "XCTest provider is missing its target or bundle storage.",
                          "missing_collaborator"};
    }
    std::shared_ptr<protocol::Operation<TestRunUpdate>> operation =
        std::make_shared<XCTestOperation>(session_id, request, target_,
                                          bundle_storage_, work_root_);
    return operation;
}

std::unique_ptr<XCTestDeltaUpdateManager> make_xctest_manager(
    std::shared_ptr<const target::Target> target,
    std::shared_ptr<const target::BundleStorage> bundle_storage,
    std::filesystem::path work_root, core::config::ManagerConfig config) {
    auto provider = std::make_shared<XCTestOperationProvider>(
        std::move(target), std::move(bundle_storage), std::move(work_root));
    return std::make_unique<XCTestDeltaUpdateManager>(std::move(provider), config);
}

}  // namespace xcdelta::runtime
