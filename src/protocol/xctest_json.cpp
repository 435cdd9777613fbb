#include "protocol/xctest_json.hpp"

#include <cstdint>
#include <limits>

namespace xcdelta::protocol {

using core::errors::DeltaError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

DeltaError malformed(const std::string& message) {
    return DeltaError{ErrorCategory::InvalidRequest, message,
                      "malformed_test_result"};
}

}  // namespace

json test_update_to_json(const TestRunUpdate& update) {
    json payload;
    payload["bundle_name"] = update.bundle_name;
    payload["class_name"] = update.class_name;
    payload["method_name"] = update.method_name;
    payload["status"] = to_string(update.status);
    payload["duration"] = update.duration_seconds;
    payload["logs"] = update.logs;
    if (update.failure.has_value()) {
        json failure;
        failure["message"] = update.failure->message;
        failure["file"] = update.failure->file;
        failure["line"] = update.failure->line;
        payload["failure_info"] = failure;
    } else {
        payload["failure_info"] = nullptr;
    }
    return payload;
}

core::errors::Result<TestRunUpdate> parse_test_update(const std::string& json_text) {
    const json payload = json::parse(json_text, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return malformed("Test result is not a JSON object.");
    }

    TestRunUpdate update;
    const auto read_string = [&payload](const char* key, std::string& out) {
        if (!payload.contains(key)) {
            return true;
        }
        if (!payload.at(key).is_string()) {
            return false;
        }
        out = payload.at(key).get<std::string>();
        return true;
    };

    if (!read_string("bundle", update.bundle_name) ||
        !read_string("class", update.class_name) ||
        !read_string("method", update.method_name)) {
        return malformed("Test result names must be strings.");
    }
    if (update.class_name.empty() || update.method_name.empty()) {
        return malformed("Test result requires 'class' and 'method'.");
    }

    if (!payload.contains("status") || !payload.at("status").is_string()) {
        return malformed("Test result requires a string 'status'.");
    }
    const auto status = parse_test_status(payload.at("status").get<std::string>());
    if (!status.has_value()) {
        return malformed("Unknown test status: " +
                         payload.at("status").get<std::string>());
    }
    update.status = status.value();

    if (payload.contains("duration")) {
        if (!payload.at("duration").is_number()) {
            return malformed("Test result 'duration' must be a number.");
        }
        update.duration_seconds = payload.at("duration").get<double>();
    }

    if (payload.contains("logs")) {
        const auto& logs = payload.at("logs");
        if (!logs.is_array()) {
            return malformed("Test result 'logs' must be an array.");
        }
        for (const auto& line : logs) {
            if (!line.is_string()) {
                return malformed("Test result 'logs' entries must be strings.");
            }
            update.logs.push_back(line.get<std::string>());
        }
    }

    if (payload.contains("failure") && !payload.at("failure").is_null()) {
        const auto& failure = payload.at("failure");
        if (!failure.is_object()) {
            return malformed("Test result 'failure' must be an object.");
        }
        if (failure.contains("line") &&
            (!failure.at("line").is_number_unsigned() ||
             failure.at("line").get<std::uint64_t>() >
                 std::numeric_limits<std::uint32_t>::max())) {
            return malformed("Test result failure 'line' must be a non-negative integer.");
        }
        TestFailureInfo info;
        try {
            info.message = failure.value("message", std::string());
            info.file = failure.value("file", std::string());
            info.line = failure.value("line", static_cast<std::uint32_t>(0));
        } catch (const json::exception& ex) {
            return malformed(std::string("Test result 'failure' is invalid: ") + ex.what());
        }
        update.failure = info;
    }

    return update;
}

json request_to_json(const XCTestRunRequest& request) {
    json payload;
    payload["mode"] = to_string(request.mode);
    payload["test_bundle_id"] = request.test_bundle_id;
    payload["app_bundle_id"] =
        request.app_bundle_id.has_value() ? request.app_bundle_id.value() : "";
    payload["test_host_app_bundle_id"] = request.test_host_app_bundle_id.has_value()
                                             ? request.test_host_app_bundle_id.value()
                                             : "";
    payload["environment"] = request.environment;
    payload["arguments"] = request.arguments;
    payload["tests_to_run"] = request.tests_to_run;
    payload["tests_to_skip"] = request.tests_to_skip;
    if (request.timeout_seconds.has_value()) {
        payload["timeout_seconds"] = request.timeout_seconds.value();
    } else {
        payload["timeout_seconds"] = nullptr;
    }
    payload["collect_logs"] = request.collect_logs;
    payload["collect_result_bundle"] = request.collect_result_bundle;
    return payload;
}

json error_to_json(const DeltaError& error) {
    json payload;
    payload["category"] = core::errors::to_string(error.category);
    payload["code"] = error.code;
    payload["message"] = error.message;
    if (!error.hint.empty()) {
        payload["hint"] = error.hint;
    }
    return payload;
}

json snapshot_to_json(const DeltaSnapshot<TestRunUpdate>& delta) {
    json results = json::array();
    for (const auto& update : delta.results) {
        results.push_back(test_update_to_json(update));
    }

    json payload;
    payload["identifier"] = delta.identifier;
    payload["results"] = results;
    payload["log_output"] = delta.log_output;
    payload["state"] = to_string(delta.state);
    payload["error"] = delta.error.has_value() ? error_to_json(delta.error.value())
                                               : json(nullptr);
    payload["result_bundle_path"] = delta.artifact_path.has_value()
                                        ? json(delta.artifact_path.value())
                                        : json(nullptr);
    payload["cursor"] = {{"fragments", delta.next.fragments},
                         {"log_offset", delta.next.log_offset}};
    return payload;
}

std::string to_json_line(const json& payload) {
    return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace xcdelta::protocol
