#include "cli_parser.hpp"
#include <charconv>
#include <map>
#include <optional>
#include <system_error>
#include <vector>

namespace xcdelta::app::cli {

    using namespace xcdelta::core::errors;
    using xcdelta::protocol::XCTestRunRequest;

    // Raw options as typed, before validation
    struct RawCliOptions {
        std::optional<std::string> bundle_storage;
        std::optional<std::string> test_bundle;
        std::optional<std::string> mode;
        std::optional<std::string> app;
        std::optional<std::string> test_host;
        std::optional<std::string> session_id;
        std::optional<std::string> work_dir;
        std::optional<std::string> config;
        std::optional<std::string> timeout;
        std::optional<std::string> poll_interval_ms;
        std::vector<std::string> tests;
        std::vector<std::string> skips;
        std::vector<std::string> env;
        std::vector<std::string> args;
        bool no_logs = false;
        bool result_bundle = false;
        bool verbose = false;
    };

    namespace {

        DeltaError input_error(const std::string& message, const std::string& code,
                               const std::string& hint = "") {
            return DeltaError{ErrorCategory::InvalidRequest, message, code, hint};
        }

        std::optional<std::uint32_t> parse_uint(const std::string& text) {
            std::uint32_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return std::nullopt;
            }
            return value;
        }

        Result<std::filesystem::path> existing_directory(const std::string& raw,
                                                         const std::string& flag) {
            std::filesystem::path p(raw);
            std::error_code ec;
            const bool is_dir = std::filesystem::is_directory(p, ec);
            if (ec || !is_dir) {
                return input_error(flag + " does not exist or is not a directory",
                                   "invalid_path");
            }
            std::filesystem::path canonical_path = std::filesystem::canonical(p, ec);
            if (ec) {
                return input_error("Failed to canonicalize " + flag, "invalid_path");
            }
            return canonical_path;
        }

    }  // namespace

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return input_error("No command provided.", "missing_command",
                               "Usage: xcdelta_cli run --bundle-storage DIR --test-bundle ID");
        }

        std::string command = argv[1];
        if (command != "run") {
            return input_error("Unknown command: " + command, "unknown_command",
                               "Currently only the 'run' command is supported.");
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 1. Parser phase: collect raw strings
        const std::map<std::string, std::optional<std::string>*> single_valued = {
            {"--bundle-storage", &raw.bundle_storage},
            {"--test-bundle", &raw.test_bundle},
            {"--mode", &raw.mode},
            {"--app", &raw.app},
            {"--test-host", &raw.test_host},
            {"--session-id", &raw.session_id},
            {"--work-dir", &raw.work_dir},
            {"--config", &raw.config},
            {"--timeout", &raw.timeout},
            {"--poll-interval-ms", &raw.poll_interval_ms},
        };
        const std::map<std::string, std::vector<std::string>*> multi_valued = {
            {"--test", &raw.tests},
            {"--skip", &raw.skips},
            {"--env", &raw.env},
            {"--arg", &raw.args},
        };

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            if (flag == "--no-logs") {
                raw.no_logs = true;
                continue;
            }
            if (flag == "--result-bundle") {
                raw.result_bundle = true;
                continue;
            }
            if (flag == "--verbose") {
                raw.verbose = true;
                continue;
            }

            auto single = single_valued.find(flag);
            auto multi = multi_valued.find(flag);
            if (single == single_valued.end() && multi == multi_valued.end()) {
                return input_error("Unknown argument: " + flag, "unknown_argument");
            }
            if (i + 1 >= args.size()) {
                return input_error("Missing value for " + flag, "missing_value");
            }
            const std::string& value = args[++i];
            if (single != single_valued.end()) {
                *single->second = value;
            } else {
                multi->second->push_back(value);
            }
        }

        // 2. Validator phase
        CliOptions options;
        options.verbose = raw.verbose;
        XCTestRunRequest& req = options.request;

        if (!raw.bundle_storage.has_value()) {
            return input_error("Must provide --bundle-storage", "missing_required_flag");
        }
        if (!raw.test_bundle.has_value()) {
            return input_error("Must provide --test-bundle", "missing_required_flag");
        }

        auto storage = existing_directory(raw.bundle_storage.value(), "--bundle-storage");
        if (is_error(storage)) {
            return get_error(storage);
        }
        options.bundle_storage = get_value(storage);
        req.test_bundle_id = raw.test_bundle.value();

        if (raw.mode) {
            auto mode = protocol::parse_test_mode(raw.mode.value());
            if (!mode.has_value()) {
                return input_error("Unknown test mode: " + raw.mode.value(), "invalid_mode",
                                   "Use logic, application or ui.");
            }
            req.mode = mode.value();
        }
        if (raw.app) req.app_bundle_id = raw.app.value();
        if (raw.test_host) req.test_host_app_bundle_id = raw.test_host.value();
        req.tests_to_run = raw.tests;
        req.tests_to_skip = raw.skips;
        req.arguments = raw.args;
        req.collect_logs = !raw.no_logs;
        req.collect_result_bundle = raw.result_bundle;

        for (const auto& entry : raw.env) {
            const auto eq = entry.find('=');
            if (eq == std::string::npos || eq == 0) {
                return input_error("Invalid --env value: " + entry, "invalid_env",
                                   "Use KEY=VALUE.");
            }
            req.environment[entry.substr(0, eq)] = entry.substr(eq + 1);
        }

        if (raw.timeout) {
            auto seconds = parse_uint(raw.timeout.value());
            if (!seconds.has_value()) {
                return input_error("Invalid number for --timeout", "invalid_integer",
                                   "Provide a positive number of seconds.");
            }
            if (seconds.value() == 0 || seconds.value() > 86400) {
                return input_error("--timeout out of bounds", "bounds_error",
                                   "Must be between 1 and 86400.");
            }
            req.timeout_seconds = seconds.value();
        }

        if (raw.poll_interval_ms) {
            auto interval = parse_uint(raw.poll_interval_ms.value());
            if (!interval.has_value()) {
                return input_error("Invalid number for --poll-interval-ms", "invalid_integer");
            }
            if (interval.value() < 10 || interval.value() > 60000) {
                return input_error("--poll-interval-ms out of bounds", "bounds_error",
                                   "Must be between 10 and 60000.");
            }
            options.poll_interval_ms = interval.value();
        }

        if (raw.session_id) options.session_id = raw.session_id.value();

        if (raw.work_dir) {
            auto work_dir = existing_directory(raw.work_dir.value(), "--work-dir");
            if (is_error(work_dir)) {
                return get_error(work_dir);
            }
            options.work_root = get_value(work_dir);
        } else {
            std::error_code ec;
            const auto temp = std::filesystem::temp_directory_path(ec);
            if (ec) {
                return input_error("No temporary directory available", "invalid_path",
                                   "Pass --work-dir explicitly.");
            }
            options.work_root = temp / "xcdelta";
        }

        if (raw.config) {
            std::error_code ec;
            const bool is_file = std::filesystem::is_regular_file(raw.config.value(), ec);
            if (ec || !is_file) {
                return input_error("Config file does not exist: " + raw.config.value(),
                                   "invalid_path");
            }
            options.config_file = std::filesystem::path(raw.config.value());
        }

        return options;
    }

} // namespace xcdelta::app::cli
