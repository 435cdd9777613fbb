#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/delta_errors.hpp"
#include "runtime/process_runner.hpp"

namespace {

using xcdelta::core::errors::get_error;
using xcdelta::core::errors::get_value;
using xcdelta::core::errors::is_error;
using xcdelta::runtime::OutputStream;
using xcdelta::runtime::ProcessRunner;
using xcdelta::runtime::ProcessSpec;

struct CapturedLines {
    std::mutex mutex;
    std::vector<std::string> stdout_lines;
    std::vector<std::string> stderr_lines;

    xcdelta::runtime::LineHandler handler() {
        return [this](OutputStream stream, const std::string& line) {
            std::lock_guard<std::mutex> lock(mutex);
            if (stream == OutputStream::Stdout) {
                stdout_lines.push_back(line);
            } else {
                stderr_lines.push_back(line);
            }
        };
    }
};

ProcessSpec shell(const std::string& script) {
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", script};
    spec.working_directory = std::filesystem::current_path();
    return spec;
}

TEST(ProcessRunnerTest, StreamsLinesInOrder) {
    CapturedLines lines;
    ProcessRunner runner;
    auto result = runner.run(shell("echo one; echo two; printf three"), lines.handler());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 0);
    EXPECT_FALSE(get_value(result).cancelled);
    EXPECT_FALSE(get_value(result).timed_out);
    EXPECT_EQ(lines.stdout_lines, (std::vector<std::string>{"one", "two", "three"}));
}

TEST(ProcessRunnerTest, SeparatesStderrAndReportsExitCode) {
    CapturedLines lines;
    ProcessRunner runner;
    auto result = runner.run(shell("echo oops 1>&2; exit 3"), lines.handler());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 3);
    EXPECT_TRUE(lines.stdout_lines.empty());
    EXPECT_EQ(lines.stderr_lines, std::vector<std::string>{"oops"});
}

TEST(ProcessRunnerTest, PassesEnvironmentOverrides) {
    CapturedLines lines;
    ProcessSpec spec = shell("echo \"$XCDELTA_PROBE\"");
    spec.environment["XCDELTA_PROBE"] = "visible";
    ProcessRunner runner;
    auto result = runner.run(spec, lines.handler());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(lines.stdout_lines, std::vector<std::string>{"visible"});
}

TEST(ProcessRunnerTest, CancellationKillsTheProcess) {
    ProcessSpec spec = shell("echo started; sleep 30");
    spec.cancel_token = std::make_shared<std::atomic_bool>(false);
    auto token = spec.cancel_token;

    std::thread canceller([token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token->store(true);
    });

    CapturedLines lines;
    ProcessRunner runner;
    const auto started = std::chrono::steady_clock::now();
    auto result = runner.run(spec, lines.handler());
    canceller.join();

    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
    EXPECT_EQ(lines.stdout_lines, std::vector<std::string>{"started"});
}

TEST(ProcessRunnerTest, AlreadyCancelledTokenSkipsSpawn) {
    ProcessSpec spec = shell("echo never");
    spec.cancel_token = std::make_shared<std::atomic_bool>(true);
    CapturedLines lines;
    ProcessRunner runner;
    auto result = runner.run(spec, lines.handler());
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).cancelled);
    EXPECT_TRUE(lines.stdout_lines.empty());
}

TEST(ProcessRunnerTest, TimeoutKillsTheProcess) {
    ProcessSpec spec = shell("sleep 30");
    spec.timeout_ms = 200;
    ProcessRunner runner;
    auto result = runner.run(spec, nullptr);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).timed_out);
    EXPECT_NE(get_value(result).exit_code, 0);
}

TEST(ProcessRunnerTest, TimeoutBeyondThirtyTwoBitsDoesNotFire) {
    ProcessSpec spec = shell("sleep 1; exit 0");
    spec.timeout_ms = 4294968000ULL;
    ProcessRunner runner;
    auto result = runner.run(spec, nullptr);
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result).timed_out);
    EXPECT_EQ(get_value(result).exit_code, 0);
}

TEST(ProcessRunnerTest, MissingExecutableExitsWith127) {
    ProcessSpec spec;
    spec.argv = {"/nonexistent/xcdelta-runner"};
    ProcessRunner runner;
    auto result = runner.run(spec, nullptr);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 127);
}

TEST(ProcessRunnerTest, RejectsEmptyCommandLine) {
    ProcessRunner runner;
    auto result = runner.run(ProcessSpec{}, nullptr);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "empty_command");
}

}  // namespace
