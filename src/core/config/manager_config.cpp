#include "core/config/manager_config.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace xcdelta::core::config {

using core::errors::DeltaError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

// One year. Larger values overflow steady_clock arithmetic.
constexpr std::int64_t kMaxDurationMs = 365LL * 24 * 60 * 60 * 1000;

DeltaError config_error(const std::string& message, const std::string& code) {
    return DeltaError{ErrorCategory::InvalidRequest, message, code};
}

core::errors::Result<std::chrono::milliseconds> read_duration_ms(
    const json& root, const char* key, const std::chrono::milliseconds fallback) {
    if (!root.contains(key)) {
        return fallback;
    }
    const auto& value = root.at(key);
    if (!value.is_number_integer()) {
        return config_error(std::string("Config field '") + key +
                                "' must be an integer number of milliseconds.",
                            "config_invalid_type");
    }
    if (value.is_number_unsigned() &&
        value.get<std::uint64_t>() > static_cast<std::uint64_t>(kMaxDurationMs)) {
        return config_error(std::string("Config field '") + key +
                                "' exceeds " + std::to_string(kMaxDurationMs) + " ms.",
                            "config_out_of_range");
    }
    const auto ms = value.get<std::int64_t>();
    if (ms < 0) {
        return config_error(std::string("Config field '") + key +
                                "' cannot be negative.",
                            "config_out_of_range");
    }
    return std::chrono::milliseconds(ms);
}

}  // namespace

core::errors::Result<ManagerConfig> parse_manager_config(const std::string& json_text) {
    const json root = json::parse(json_text, nullptr, false);
    if (root.is_discarded()) {
        return config_error("Config is not valid JSON.", "config_parse_failed");
    }
    if (!root.is_object()) {
        return config_error("Config root must be a JSON object.",
                            "config_invalid_type");
    }

    ManagerConfig config;

    auto retention = read_duration_ms(root, "retention_ms", config.retention);
    if (core::errors::is_error(retention)) {
        return core::errors::get_error(retention);
    }
    config.retention = core::errors::get_value(retention);

    auto reap_interval =
        read_duration_ms(root, "reap_interval_ms", config.reap_interval);
    if (core::errors::is_error(reap_interval)) {
        return core::errors::get_error(reap_interval);
    }
    config.reap_interval = core::errors::get_value(reap_interval);

    auto lifetime = read_duration_ms(root, "max_session_lifetime_ms",
                                     config.max_session_lifetime);
    if (core::errors::is_error(lifetime)) {
        return core::errors::get_error(lifetime);
    }
    config.max_session_lifetime = core::errors::get_value(lifetime);

    if (root.contains("max_live_sessions")) {
        const auto& value = root.at("max_live_sessions");
        if (!value.is_number_unsigned()) {
            return config_error(
                "Config field 'max_live_sessions' must be a non-negative integer.",
                "config_invalid_type");
        }
        config.max_live_sessions = value.get<std::size_t>();
    }

    if (root.contains("log_level")) {
        const auto& value = root.at("log_level");
        if (!value.is_string()) {
            return config_error("Config field 'log_level' must be a string.",
                                "config_invalid_type");
        }
        const auto level = logging::parse_log_level(value.get<std::string>());
        if (!level.has_value()) {
            return DeltaError{ErrorCategory::InvalidRequest,
                              "Unknown log level: " + value.get<std::string>(),
                              "config_out_of_range",
                              "Use one of: debug, info, warn, error."};
        }
        config.log_level = level.value();
    }

    return config;
}

core::errors::Result<ManagerConfig> load_manager_config(
    const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return config_error("Unable to open config file: " + path.string(),
                            "config_open_failed");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_manager_config(buffer.str());
}

}  // namespace xcdelta::core::config
