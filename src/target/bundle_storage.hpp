#pragma once

#include <filesystem>
#include <string>
#include "core/errors/delta_errors.hpp"

namespace xcdelta::target {

struct TestBundle {
    std::string bundle_id;
    std::filesystem::path path;
    // Executable that runs the bundle's tests and reports results.
    std::filesystem::path runner;
};

// Resolves installed test bundles by identifier.
class BundleStorage {
public:
    virtual ~BundleStorage() = default;

    virtual core::errors::Result<TestBundle> resolve(const std::string& bundle_id) const = 0;
};

// Bundles live under <root>/<bundle_id>/ with their runner at
// <root>/<bundle_id>/run.
class DirectoryBundleStorage : public BundleStorage {
public:
    explicit DirectoryBundleStorage(std::filesystem::path root);

    core::errors::Result<TestBundle> resolve(const std::string& bundle_id) const override;

    const std::filesystem::path& root() const { return root_; }

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);

    std::filesystem::path root_;
};

}  // namespace xcdelta::target
