#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include "core/errors/delta_errors.hpp"
#include "core/logging/logger.hpp"

namespace xcdelta::core::config {

struct ManagerConfig {
    // How long a terminal session stays pollable before the reaper drops it.
    std::chrono::milliseconds retention{60000};
    // Reaper wake-up period. Zero disables the background reaper.
    std::chrono::milliseconds reap_interval{1000};
    // Live sessions older than this are terminated. Zero means no limit.
    std::chrono::milliseconds max_session_lifetime{0};
    // Zero means unlimited.
    std::size_t max_live_sessions = 0;
    logging::LogLevel log_level = logging::LogLevel::INFO;
};

core::errors::Result<ManagerConfig> parse_manager_config(const std::string& json_text);

core::errors::Result<ManagerConfig> load_manager_config(const std::filesystem::path& path);

}  // namespace xcdelta::core::config
