#include "lpkg_source.hpp"

#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <sys/stat.h>

#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

LpkgDbSource::LpkgDbSource()
    : LpkgDbSource(LPKG_STATE_DIR, ROOT_DIR) {}

LpkgDbSource::LpkgDbSource(fs::path state_dir, fs::path root_dir)
    : pkgs_file_(state_dir / "pkgs"),
      dep_dir_(state_dir / "deps"),
      files_dir_(state_dir / "files"),
      provides_db_(state_dir / "provides.db"),
      root_dir_(std::move(root_dir)) {}

std::map<std::string, std::string, std::less<>> LpkgDbSource::read_installed() const {
    if (!fs::exists(pkgs_file_)) {
        throw DatabaseError(pkgs_file_, string_format("error.open_file_failed", pkgs_file_.string()));
    }
    std::map<std::string, std::string, std::less<>> installed;
    for (const auto& line : read_lines(pkgs_file_)) {
        if (auto pos = line.find(':'); pos != std::string::npos) {
            installed[line.substr(0, pos)] = line.substr(pos + 1);
        } else {
            log_warning(string_format("warning.malformed_pkgs_line", line));
        }
    }
    return installed;
}

std::map<std::string, std::set<std::string>, std::less<>> LpkgDbSource::read_providers() const {
    std::map<std::string, std::set<std::string>, std::less<>> providers;
    std::ifstream db_file(provides_db_);
    if (!db_file.is_open()) return providers;
    std::string capability, pkg;
    while (db_file >> capability >> pkg) {
        providers[capability].insert(pkg);
    }
    return providers;
}

std::vector<DependencyGroup> LpkgDbSource::read_dependencies(std::string_view pkg_name,
    const std::map<std::string, std::set<std::string>, std::less<>>& providers) const {
    std::vector<DependencyGroup> groups;
    const fs::path dep_file = dep_dir_ / pkg_name;
    if (!fs::exists(dep_file)) return groups;

    for (const auto& line : read_lines(dep_file)) {
        std::string d_name = line;
        if (const auto pos = line.find_first_of(" \t<>="); pos != std::string::npos) d_name = line.substr(0, pos);
        if (d_name.empty()) continue;

        // A capability is satisfied by the package of that name or any provider
        DependencyGroup group{d_name};
        if (auto it = providers.find(d_name); it != providers.end()) {
            for (const auto& prov : it->second) {
                if (prov != d_name) group.push_back(prov);
            }
        }
        groups.push_back(std::move(group));
    }
    return groups;
}

std::vector<std::string> LpkgDbSource::read_files(std::string_view pkg_name) const {
    const fs::path list = files_dir_ / (std::string(pkg_name) + ".txt");
    if (!fs::exists(list)) return {};
    return read_lines(list);
}

std::uint64_t LpkgDbSource::measure_files(const std::vector<std::string>& files) const {
    std::uint64_t total = 0;
    for (const auto& logical : files) {
        const fs::path physical = root_dir_ / fs::path(logical).relative_path();
        struct stat st;
        if (lstat(physical.c_str(), &st) != 0) continue;
        if (S_ISREG(st.st_mode) || S_ISLNK(st.st_mode)) {
            total += static_cast<std::uint64_t>(st.st_size);
        }
    }
    return total;
}

std::vector<PackageRecord> LpkgDbSource::load_installed() {
    const auto installed = read_installed();
    const auto providers = read_providers();

    std::vector<PackageRecord> records;
    records.reserve(installed.size());
    for (const auto& [name, version] : installed) {
        PackageRecord record;
        record.name = name;
        record.dependency_groups = read_dependencies(name, providers);
        record.installed_files = read_files(name);
        record.own_size = measure_files(record.installed_files);
        records.push_back(std::move(record));
    }
    return records;
}
