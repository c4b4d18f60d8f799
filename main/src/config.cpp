#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <sys/utsname.h>

#include <charconv>
#include <limits>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

fs::path ROOT_DIR = "/";
fs::path CONFIG_DIR = PKGSLIM_CONF_DIR;
fs::path SETTINGS_FILE = fs::path(PKGSLIM_CONF_DIR) / "pkgslim.conf";

fs::path DPKG_ADMIN_DIR = "/var/lib/dpkg";
fs::path DPKG_STATUS_FILE = fs::path("/var/lib/dpkg") / "status";
fs::path DPKG_INFO_DIR = fs::path("/var/lib/dpkg") / "info";

fs::path LPKG_STATE_DIR = "/var/lib/lpkg";
fs::path LPKG_PKGS_FILE = fs::path("/var/lib/lpkg") / "pkgs";
fs::path LPKG_DEP_DIR = fs::path("/var/lib/lpkg") / "deps/";
fs::path LPKG_FILES_DIR = fs::path("/var/lib/lpkg") / "files/";
fs::path LPKG_PROVIDES_DB = fs::path("/var/lib/lpkg") / "provides.db";

fs::path DU_BIN_PATH = "/usr/bin/du";

void set_root_path(const std::string& root_path) {
    ROOT_DIR = fs::path(root_path).lexically_normal();
    if (ROOT_DIR.empty()) ROOT_DIR = "/";

    auto rebase = [&](const std::string& default_path) {
        fs::path p(default_path);
        if (p.is_absolute()) {
            return ROOT_DIR / p.relative_path();
        }
        return ROOT_DIR / p;
    };

    CONFIG_DIR = rebase(PKGSLIM_CONF_DIR);
    SETTINGS_FILE = CONFIG_DIR / "pkgslim.conf";

    DPKG_ADMIN_DIR = rebase("/var/lib/dpkg");
    DPKG_STATUS_FILE = DPKG_ADMIN_DIR / "status";
    DPKG_INFO_DIR = DPKG_ADMIN_DIR / "info";

    LPKG_STATE_DIR = rebase("/var/lib/lpkg");
    LPKG_PKGS_FILE = LPKG_STATE_DIR / "pkgs";
    LPKG_DEP_DIR = LPKG_STATE_DIR / "deps/";
    LPKG_FILES_DIR = LPKG_STATE_DIR / "files/";
    LPKG_PROVIDES_DB = LPKG_STATE_DIR / "provides.db";
}

void set_du_path(const std::string& du_path) {
    DU_BIN_PATH = du_path;
}

static std::string g_architecture_override;

void set_architecture(const std::string& arch) {
    g_architecture_override = arch;
}

std::string get_architecture() {
    if (!g_architecture_override.empty()) {
        return g_architecture_override;
    }

    struct utsname buf;
    if (uname(&buf) != 0) {
        throw PkgslimException(get_string("error.get_arch_failed"));
    }
    std::string arch(buf.machine);
    if (arch == "x86_64") return "amd64";
    if (arch == "aarch64") return "arm64";
    if (arch == "i386" || arch == "i586" || arch == "i686") return "i386";
    if (arch.starts_with("armv7") || arch.starts_with("armv6")) return "armhf";
    if (arch == "ppc64le") return "ppc64el";
    return arch; // riscv64, s390x, mips64el share the kernel name
}

Backend parse_backend(const std::string& name) {
    if (name == "dpkg") return Backend::DPKG;
    if (name == "lpkg") return Backend::LPKG;
    throw PkgslimException(string_format("error.unknown_backend", name));
}

namespace {

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "yes" || value == "1") return true;
    if (value == "false" || value == "no" || value == "0") return false;
    throw PkgslimException(string_format("error.invalid_setting_value", key, value));
}

long long parse_integer(const std::string& key, const std::string& value, long long min, long long max) {
    long long result = 0;
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, result);
    if (ec != std::errc() || ptr != end || result < min || result > max) {
        throw PkgslimException(string_format("error.invalid_setting_value", key, value));
    }
    return result;
}

} // anonymous namespace

Settings load_settings(const fs::path& path) {
    Settings settings;
    if (!fs::exists(path)) return settings;

    std::ifstream file(path);
    if (!file.is_open()) {
        throw PkgslimException(string_format("error.open_file_failed", path.string()));
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') continue;

        auto pos = stripped.find('=');
        if (pos == std::string::npos) {
            throw PkgslimException(string_format("error.malformed_setting", path.string(), line_no));
        }
        std::string key = trim(std::string_view(stripped).substr(0, pos));
        std::string value = trim(std::string_view(stripped).substr(pos + 1));

        if (key == "max_results") {
            settings.max_results = static_cast<std::size_t>(parse_integer(key, value, 0, std::numeric_limits<long long>::max()));
        } else if (key == "max_depth") {
            settings.max_depth = static_cast<int>(parse_integer(key, value, 1, std::numeric_limits<int>::max()));
        } else if (key == "explore_var") {
            settings.explore_var = parse_bool(key, value);
        } else if (key == "verbose") {
            settings.verbose = parse_bool(key, value);
        } else if (key == "backend") {
            settings.backend = parse_backend(value);
        } else {
            log_warning(string_format("warning.unknown_setting", key, path.string()));
        }
    }
    return settings;
}
