#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/delta_errors.hpp"
#include "protocol/delta_snapshot.hpp"
#include "protocol/test_run_request.hpp"
#include "protocol/test_run_update.hpp"

namespace xcdelta::protocol {

// Runner output lines carrying a test result start with this prefix.
inline constexpr const char* kTestResultLinePrefix = "##xcdelta ";

nlohmann::json test_update_to_json(const TestRunUpdate& update);

core::errors::Result<TestRunUpdate> parse_test_update(const std::string& json_text);

nlohmann::json request_to_json(const XCTestRunRequest& request);

nlohmann::json error_to_json(const core::errors::DeltaError& error);

nlohmann::json snapshot_to_json(const DeltaSnapshot<TestRunUpdate>& delta);

// Single-line JSON text. Invalid UTF-8 from runner output or request values is
// replaced with U+FFFD instead of throwing.
std::string to_json_line(const nlohmann::json& payload);

}  // namespace xcdelta::protocol
