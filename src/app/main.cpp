#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include "app/cli_parser.hpp"
#include "core/config/manager_config.hpp"
#include "core/errors/delta_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/delta_snapshot.hpp"
#include "protocol/xctest_json.hpp"
#include "runtime/xctest_operation.hpp"
#include "target/bundle_storage.hpp"
#include "target/target.hpp"

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt(int) {
    g_interrupted = 1;
}

int exit_code_for(const xcdelta::protocol::SessionState state) {
    switch (state) {
        case xcdelta::protocol::SessionState::Completed:
            return 0;
        case xcdelta::protocol::SessionState::Failed:
            return 1;
        case xcdelta::protocol::SessionState::Cancelled:
            return 130;
        default:
            return 4;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace errors = xcdelta::core::errors;

    XCDELTA_LOG_DEBUG("xcdelta: bootstrapping...");
    auto parsed = xcdelta::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        const auto& err = errors::get_error(parsed);
        XCDELTA_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            XCDELTA_LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& options = errors::get_value(parsed);

    xcdelta::core::config::ManagerConfig config;
    if (options.config_file.has_value()) {
        auto loaded = xcdelta::core::config::load_manager_config(options.config_file.value());
        if (errors::is_error(loaded)) {
            const auto& err = errors::get_error(loaded);
            XCDELTA_LOG_ERROR("Config error [" + err.code + "]: " + err.message);
            return 2;
        }
        config = errors::get_value(loaded);
    }
    xcdelta::core::logging::Logger::get().set_min_level(
        options.verbose ? xcdelta::core::logging::LogLevel::DEBUG : config.log_level);

    auto manager = xcdelta::runtime::make_xctest_manager(
        std::make_shared<xcdelta::target::LocalTarget>(),
        std::make_shared<xcdelta::target::DirectoryBundleStorage>(options.bundle_storage),
        options.work_root, config);

    auto started = manager->start_session(options.request, options.session_id);
    if (errors::is_error(started)) {
        const auto& err = errors::get_error(started);
        XCDELTA_LOG_ERROR("Failed to start session [" + err.code + "]: " + err.message);
        return 3;
    }
    const std::string session_id = errors::get_value(started);
    xcdelta::core::logging::Logger::get().set_context(session_id);

    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);

    xcdelta::protocol::DeltaCursor cursor;
    bool termination_sent = false;
    xcdelta::protocol::SessionState last_state = xcdelta::protocol::SessionState::Pending;
    bool first = true;
    while (true) {
        if (g_interrupted != 0 && !termination_sent) {
            termination_sent = true;
            XCDELTA_LOG_INFO("Interrupted, terminating session");
            auto terminated = manager->terminate(session_id);
            if (errors::is_error(terminated)) {
                const auto& err = errors::get_error(terminated);
                XCDELTA_LOG_ERROR("Terminate failed [" + err.code + "]: " + err.message);
            }
        }

        auto polled = manager->poll(session_id, cursor);
        if (errors::is_error(polled)) {
            const auto& err = errors::get_error(polled);
            XCDELTA_LOG_ERROR("Poll failed [" + err.code + "]: " + err.message);
            return 5;
        }
        const auto& delta = errors::get_value(polled);
        cursor = delta.next;

        const bool changed = first || !delta.results.empty() ||
                             !delta.log_output.empty() || delta.state != last_state;
        if (changed) {
            std::cout << xcdelta::protocol::to_json_line(
                             xcdelta::protocol::snapshot_to_json(delta))
                      << std::endl;
        }
        first = false;
        last_state = delta.state;

        if (xcdelta::protocol::is_terminal(delta.state)) {
            XCDELTA_LOG_INFO("Final session state: " +
                             xcdelta::protocol::to_string(delta.state));
            return exit_code_for(delta.state);
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(options.poll_interval_ms));
    }
}
