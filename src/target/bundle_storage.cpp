#include "target/bundle_storage.hpp"

#include <system_error>
#include <utility>

namespace xcdelta::target {

using core::errors::DeltaError;
using core::errors::ErrorCategory;

namespace {

constexpr const char* kRunnerName = "run";

}  // namespace

DirectoryBundleStorage::DirectoryBundleStorage(std::filesystem::path root)
    : root_(std::move(root)) {}

bool DirectoryBundleStorage::is_within_root(const std::filesystem::path& root,
                                            const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

core::errors::Result<TestBundle> DirectoryBundleStorage::resolve(
    const std::string& bundle_id) const {
    if (bundle_id.empty()) {
        return DeltaError{ErrorCategory::InvalidRequest,
                          "Test bundle identifier cannot be empty.",
                          "invalid_bundle_id"};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec) || ec) {
        return DeltaError{ErrorCategory::NotFound,
                          "Bundle storage root is not a directory: " + root_.string(),
                          "invalid_bundle_storage"};
    }

    const std::filesystem::path canonical_root =
        std::filesystem::weakly_canonical(root_, ec);
    if (ec) {
        return DeltaError{ErrorCategory::Internal,
                          "Unable to resolve bundle storage root: " + root_.string(),
                          "invalid_bundle_storage"};
    }

    const std::filesystem::path candidate =
        std::filesystem::weakly_canonical(canonical_root / bundle_id, ec);
    if (ec) {
        return DeltaError{ErrorCategory::InvalidRequest,
                          "Unable to resolve test bundle: " + bundle_id,
                          "invalid_bundle_id"};
    }
    if (candidate == canonical_root || !is_within_root(canonical_root, candidate)) {
        return DeltaError{ErrorCategory::InvalidRequest,
                          "Test bundle escapes bundle storage: " + bundle_id,
                          "bundle_outside_storage"};
    }

    if (!std::filesystem::is_directory(candidate, ec) || ec) {
        return DeltaError{ErrorCategory::NotFound,
                          "Test bundle is not installed: " + bundle_id,
                          "bundle_not_found",
                          "Install the bundle under " + canonical_root.string()};
    }

    const auto runner = candidate / kRunnerName;
    if (!std::filesystem::is_regular_file(runner, ec) || ec) {
        return DeltaError{ErrorCategory::NotFound,
                          "Test bundle has no runner: " + runner.string(),
                          "bundle_runner_missing"};
    }

    return TestBundle{bundle_id, candidate, runner};
}

}  // namespace xcdelta::target
