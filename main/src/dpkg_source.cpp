#include "dpkg_source.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <apt-pkg/cachefile.h>
#include <apt-pkg/configuration.h>
#include <apt-pkg/error.h>
#include <apt-pkg/init.h>
#include <apt-pkg/pkgcache.h>
#include <apt-pkg/pkgsystem.h>

#include <string_view>

namespace fs = std::filesystem;

namespace {

// Drains APT's error stack into one line
std::string pop_apt_errors() {
    std::string all;
    std::string msg;
    while (!_error->empty()) {
        _error->PopMessage(msg);
        if (!all.empty()) all += "; ";
        all += msg;
    }
    return all;
}

bool is_installed(const pkgCache::PkgIterator& pkg) {
    return !pkg.end() && !pkg.CurrentVer().end();
}

// Name of the package a dependency alternative points at. An unqualified
// dependency of a foreign package targets its own architecture; when that one
// is not installed the native package (Multi-Arch: foreign) satisfies it.
// "name:any" targets an implicit package, so any installed member is used.
std::string target_name(pkgCache::PkgIterator target) {
    if (is_installed(target)) return target.FullName(true);

    pkgCache::GrpIterator group = target.Group();
    if (group.end()) return target.FullName(true);

    pkgCache::PkgIterator native = group.FindPkg("native");
    if (is_installed(native)) return native.FullName(true);

    const char* arch = target.Arch();
    if (arch != nullptr && std::string_view(arch) == "any") {
        for (pkgCache::PkgIterator member = group.PackageList(); !member.end(); member = group.NextPkg(member)) {
            if (is_installed(member)) return member.FullName(true);
        }
    }
    return target.FullName(true);
}

} // anonymous namespace

DpkgStatusSource::DpkgStatusSource(fs::path status_file, fs::path info_dir,
                                   std::string native_arch, bool with_files)
    : status_file_(std::move(status_file)),
      info_dir_(std::move(info_dir)),
      native_arch_(std::move(native_arch)),
      with_files_(with_files) {}

// dpkg keeps the foreign architectures next to the status file
std::vector<std::string> DpkgStatusSource::foreign_architectures() const {
    const fs::path arch_file = status_file_.parent_path() / "arch";
    if (!fs::exists(arch_file)) return {};
    std::vector<std::string> archs;
    for (const auto& line : read_lines(arch_file)) {
        std::string arch = trim(line);
        if (!arch.empty() && arch != native_arch_) archs.push_back(arch);
    }
    return archs;
}

void DpkgStatusSource::init_apt() const {
    if (!pkgInitConfig(*_config)) {
        throw DatabaseError(status_file_, string_format("error.apt_init_failed", pop_apt_errors()));
    }

    _config->Set("Dir::State::status", status_file_.string());
    // No sources: the cache is built from the status file alone, in memory
    _config->Set("Dir::Etc::sourcelist", "/dev/null");
    _config->Set("Dir::Etc::sourceparts", "/dev/null");
    _config->Set("Dir::Cache::pkgcache", "");
    _config->Set("Dir::Cache::srcpkgcache", "");

    _config->Set("APT::Architecture", native_arch_);
    _config->Clear("APT::Architectures");
    _config->Set("APT::Architectures::", native_arch_);
    for (const auto& arch : foreign_architectures()) {
        _config->Set("APT::Architectures::", arch);
    }

    if (!pkgInitSystem(*_config, _system)) {
        throw DatabaseError(status_file_, string_format("error.apt_init_failed", pop_apt_errors()));
    }
}

std::vector<std::string> DpkgStatusSource::read_file_list(const std::string& package, const std::string& arch) const {
    for (const auto& candidate : {info_dir_ / (package + ":" + arch + ".list"), info_dir_ / (package + ".list")}) {
        if (fs::exists(candidate)) {
            return read_lines(candidate);
        }
    }
    return {};
}

std::vector<PackageRecord> DpkgStatusSource::load_installed() {
    if (!fs::exists(status_file_)) {
        throw DatabaseError(status_file_, string_format("error.open_file_failed", status_file_.string()));
    }
    init_apt();

    pkgCacheFile cache_file;
    pkgCache* cache = cache_file.GetPkgCache();
    if (cache == nullptr || _error->PendingError()) {
        throw DatabaseError(status_file_, string_format("error.apt_cache_failed", status_file_.string(), pop_apt_errors()));
    }

    std::vector<PackageRecord> records;
    for (pkgCache::PkgIterator pkg = cache->PkgBegin(); !pkg.end(); ++pkg) {
        pkgCache::VerIterator ver = pkg.CurrentVer();
        if (ver.end()) continue;

        PackageRecord record;
        record.name = pkg.FullName(true);
        // APT already converts Installed-Size from KiB
        record.own_size = static_cast<std::uint64_t>(ver->InstalledSize);

        for (pkgCache::DepIterator dep = ver.DependsList(); !dep.end();) {
            pkgCache::DepIterator start;
            pkgCache::DepIterator end;
            dep.GlobOr(start, end); // moves dep past the or-group

            if (start->Type != pkgCache::Dep::Depends && start->Type != pkgCache::Dep::PreDepends) continue;

            DependencyGroup group;
            while (true) {
                group.push_back(target_name(start.TargetPkg()));
                if (start == end) break;
                ++start;
            }
            record.dependency_groups.push_back(std::move(group));
        }

        if (with_files_) {
            record.installed_files = read_file_list(pkg.Name(), pkg.Arch());
        }
        records.push_back(std::move(record));
    }
    return records;
}
