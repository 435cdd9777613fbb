#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/delta_errors.hpp"
#include "protocol/test_run_request.hpp"

namespace xcdelta::app::cli {

    struct CliOptions {
        protocol::XCTestRunRequest request;
        std::optional<std::string> session_id;
        std::filesystem::path bundle_storage;
        std::filesystem::path work_root;
        std::optional<std::filesystem::path> config_file;
        std::uint32_t poll_interval_ms = 500;
        bool verbose = false;
    };

    xcdelta::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);
}
