#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "core/errors/delta_errors.hpp"
#include "protocol/test_run_request.hpp"
#include "target/bundle_storage.hpp"

namespace xcdelta::target {

struct TestLaunchConfiguration {
    std::vector<std::string> argv;
    std::map<std::string, std::string> environment;
    std::filesystem::path working_directory;
};

// The execution environment tests run in.
class Target {
public:
    virtual ~Target() = default;

    virtual std::string identifier() const = 0;

    virtual core::errors::Result<TestLaunchConfiguration> test_launch_configuration(
        const protocol::XCTestRunRequest& request, const TestBundle& bundle,
        const std::filesystem::path& working_directory) const = 0;
};

// Runs a bundle's runner directly on this host.
class LocalTarget : public Target {
public:
    explicit LocalTarget(std::string identifier = "local");

    std::string identifier() const override;

    core::errors::Result<TestLaunchConfiguration> test_launch_configuration(
        const protocol::XCTestRunRequest& request, const TestBundle& bundle,
        const std::filesystem::path& working_directory) const override;

private:
    std::string identifier_;
};

}  // namespace xcdelta::target
