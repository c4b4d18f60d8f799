#pragma once

#include "package_source.hpp"

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <string_view>

// Reads the lpkg state directory (pkgs, deps/, files/, provides.db)
class LpkgDbSource : public PackageSource {
public:
    LpkgDbSource();
    LpkgDbSource(std::filesystem::path state_dir, std::filesystem::path root_dir);

    std::vector<PackageRecord> load_installed() override;

private:
    std::map<std::string, std::string, std::less<>> read_installed() const;
    std::map<std::string, std::set<std::string>, std::less<>> read_providers() const;
    std::vector<DependencyGroup> read_dependencies(std::string_view pkg_name,
        const std::map<std::string, std::set<std::string>, std::less<>>& providers) const;
    std::vector<std::string> read_files(std::string_view pkg_name) const;
    std::uint64_t measure_files(const std::vector<std::string>& files) const;

    std::filesystem::path pkgs_file_;
    std::filesystem::path dep_dir_;
    std::filesystem::path files_dir_;
    std::filesystem::path provides_db_;
    std::filesystem::path root_dir_;
};
