#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/delta_errors.hpp"
#include "protocol/test_run_request.hpp"
#include "protocol/test_run_update.hpp"

namespace xcdelta::runtime {

// Appends a session's request, test results and final status to a JSONL file.
class ResultBundleWriter {
public:
    ResultBundleWriter(std::string session_id, std::filesystem::path bundle_path);

    core::errors::Result<std::filesystem::path> write_request(
        const protocol::XCTestRunRequest& request) const;

    core::errors::Result<std::filesystem::path> write_result(
        const protocol::TestRunUpdate& update) const;

    core::errors::Result<std::filesystem::path> write_final(
        const std::string& state,
        const std::optional<std::string>& error_message = std::nullopt) const;

    const std::filesystem::path& path() const { return bundle_path_; }

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& event_json) const;

    std::string session_id_;
    std::filesystem::path bundle_path_;
};

}  // namespace xcdelta::runtime
