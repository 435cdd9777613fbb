#include "runtime/result_bundle_writer.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "protocol/xctest_json.hpp"

namespace xcdelta::runtime {

using core::errors::DeltaError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

}  // namespace

ResultBundleWriter::ResultBundleWriter(std::string session_id,
                                       std::filesystem::path bundle_path)
    : session_id_(std::move(session_id)), bundle_path_(std::move(bundle_path)) {}

core::errors::Result<std::filesystem::path> ResultBundleWriter::append_event(
    const std::string& event_json) const {
    std::error_code ec;
    if (bundle_path_.has_parent_path()) {
        std::filesystem::create_directories(bundle_path_.parent_path(), ec);
        if (ec) {
            return DeltaError{ErrorCategory::Internal,
                              "Unable to create result bundle directory: " +
                                  bundle_path_.parent_path().string(),
                              "result_bundle_dir_create_failed"};
        }
    }

    std::ofstream out(bundle_path_, std::ios::app);
    if (!out.is_open()) {
        return DeltaError{ErrorCategory::Internal,
                          "Unable to open result bundle: " + bundle_path_.string(),
                          "result_bundle_open_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return DeltaError{ErrorCategory::Internal,
                          "Unable to write result bundle event: " +
                              bundle_path_.string(),
                          "result_bundle_write_failed"};
    }

    return bundle_path_;
}

core::errors::Result<std::filesystem::path> ResultBundleWriter::write_request(
    const protocol::XCTestRunRequest& request) const {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "request";
    event["session_id"] = session_id_;
    event["payload"] = protocol::request_to_json(request);
    return append_event(protocol::to_json_line(event));
}

core::errors::Result<std::filesystem::path> ResultBundleWriter::write_result(
    const protocol::TestRunUpdate& update) const {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "result";
    event["session_id"] = session_id_;
    event["payload"] = protocol::test_update_to_json(update);
    return append_event(protocol::to_json_line(event));
}

core::errors::Result<std::filesystem::path> ResultBundleWriter::write_final(
    const std::string& state, const std::optional<std::string>& error_message) const {
    json payload;
    payload["state"] = state;
    payload["error_message"] =
        error_message.has_value() ? error_message.value() : "";

    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "final";
    event["session_id"] = session_id_;
    event["payload"] = payload;
    return append_event(protocol::to_json_line(event));
}

}  // namespace xcdelta::runtime
