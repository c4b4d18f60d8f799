#pragma once

#include "package_source.hpp"

#include <filesystem>
#include <string>
#include <vector>

// Installed packages of a dpkg system, read through the APT package cache.
// Only the status file feeds the cache; repository lists are never opened.
class DpkgStatusSource : public PackageSource {
public:
    DpkgStatusSource(std::filesystem::path status_file, std::filesystem::path info_dir,
                     std::string native_arch, bool with_files);

    // Throws DatabaseError when the status file is missing or APT cannot
    // build a cache from it.
    std::vector<PackageRecord> load_installed() override;

private:
    void init_apt() const;
    std::vector<std::string> foreign_architectures() const;
    std::vector<std::string> read_file_list(const std::string& package, const std::string& arch) const;

    std::filesystem::path status_file_;
    std::filesystem::path info_dir_;
    std::string native_arch_;
    bool with_files_;
};
