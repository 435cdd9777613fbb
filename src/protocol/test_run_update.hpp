#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace xcdelta::protocol {

enum class TestStatus {
    Passed,
    Failed,
    Crashed
};

struct TestFailureInfo {
    std::string message;
    std::string file;
    std::uint32_t line = 0;
};

// One finished test method, the fragment type of XCTest sessions.
struct TestRunUpdate {
    std::string bundle_name;
    std::string class_name;
    std::string method_name;
    TestStatus status = TestStatus::Passed;
    double duration_seconds = 0.0;
    std::vector<std::string> logs;
    std::optional<TestFailureInfo> failure;
};

inline std::string to_string(const TestStatus status) {
    switch (status) {
        case TestStatus::Passed:
            return "passed";
        case TestStatus::Failed:
            return "failed";
        case TestStatus::Crashed:
            return "crashed";
        default:
            return "unknown";
    }
}

inline std::optional<TestStatus> parse_test_status(const std::string& text) {
    if (text == "passed") {
        return TestStatus::Passed;
    }
    if (text == "failed") {
        return TestStatus::Failed;
    }
    if (text == "crashed") {
        return TestStatus::Crashed;
    }
    return std::nullopt;
}

}  // namespace xcdelta::protocol
