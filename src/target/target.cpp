#include "target/target.hpp"

#include <utility>

namespace xcdelta::target {

using core::errors::DeltaError;
using core::errors::ErrorCategory;

LocalTarget::LocalTarget(std::string identifier)
    : identifier_(std::move(identifier)) {}

std::string LocalTarget::identifier() const {
    return identifier_;
}

core::errors::Result<TestLaunchConfiguration> LocalTarget::test_launch_configuration(
    const protocol::XCTestRunRequest& request, const TestBundle& bundle,
    const std::filesystem::path& working_directory) const {
    if (bundle.runner.empty()) {
        return DeltaError{ErrorCategory::Internal,
                          "Bundle " + bundle.bundle_id + " has no runner.",
                          "bundle_runner_missing"};
    }

    TestLaunchConfiguration launch;
    launch.working_directory = working_directory;
    launch.argv.push_back(bundle.runner.string());
    launch.argv.push_back("--mode");
    launch.argv.push_back(protocol::to_string(request.mode));
    if (request.app_bundle_id.has_value()) {
        launch.argv.push_back("--app");
        launch.argv.push_back(request.app_bundle_id.value());
    }
    if (request.test_host_app_bundle_id.has_value()) {
        launch.argv.push_back("--test-host");
        launch.argv.push_back(request.test_host_app_bundle_id.value());
    }
    for (const auto& test : request.tests_to_run) {
        launch.argv.push_back("--only");
        launch.argv.push_back(test);
    }
    for (const auto& test : request.tests_to_skip) {
        launch.argv.push_back("--skip");
        launch.argv.push_back(test);
    }
    if (!request.arguments.empty()) {
        launch.argv.push_back("--");
        launch.argv.insert(launch.argv.end(), request.arguments.begin(),
                           request.arguments.end());
    }

    launch.environment = request.environment;
    launch.environment["XCDELTA_TARGET"] = identifier_;
    launch.environment["XCDELTA_BUNDLE_PATH"] = bundle.path.string();
    launch.environment["XCDELTA_WORKING_DIRECTORY"] = working_directory.string();
    return launch;
}

}  // namespace xcdelta::target
