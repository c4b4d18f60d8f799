#pragma once

#include "config.hpp"
#include "package.hpp"

#include <functional>
#include <memory>
#include <vector>

// Read-only view of an installed-package database
class PackageSource {
public:
    virtual ~PackageSource() = default;

    // Throws PkgslimException when the database cannot be read.
    virtual std::vector<PackageRecord> load_installed() = 0;
};

// Records supplied up front, used for synthetic graphs
class MemoryPackageSource : public PackageSource {
public:
    explicit MemoryPackageSource(std::vector<PackageRecord> records);
    std::vector<PackageRecord> load_installed() override;

private:
    std::vector<PackageRecord> records_;
};

// Extra bytes to add to a package's own size, given its installed files
using SizeHook = std::function<std::uint64_t(const std::vector<std::string>& installed_files)>;

// Database reader for the backend, reading paths from config.hpp
std::unique_ptr<PackageSource> make_package_source(Backend backend, bool with_files);

void apply_size_hook(std::vector<PackageRecord>& records, const SizeHook& hook);
