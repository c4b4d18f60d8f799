#pragma once

#include <string>
#include <cstddef>
#include <filesystem>

// Global variables for paths (initially set to defaults, but can be modified)
extern std::filesystem::path ROOT_DIR;
extern std::filesystem::path CONFIG_DIR;
extern std::filesystem::path SETTINGS_FILE;

// dpkg database
extern std::filesystem::path DPKG_ADMIN_DIR;
extern std::filesystem::path DPKG_STATUS_FILE;
extern std::filesystem::path DPKG_INFO_DIR;

// lpkg database
extern std::filesystem::path LPKG_STATE_DIR;
extern std::filesystem::path LPKG_PKGS_FILE;
extern std::filesystem::path LPKG_DEP_DIR;
extern std::filesystem::path LPKG_FILES_DIR;
extern std::filesystem::path LPKG_PROVIDES_DB;

// Host tool, never rebased
extern std::filesystem::path DU_BIN_PATH;

inline constexpr std::size_t DEFAULT_MAX_RESULTS = 50;
inline constexpr int DEFAULT_MAX_DEPTH = 10;

enum class Backend {
    DPKG,
    LPKG
};

struct Settings {
    std::size_t max_results = DEFAULT_MAX_RESULTS;
    int max_depth = DEFAULT_MAX_DEPTH;
    bool explore_var = false;
    bool verbose = false;
    Backend backend = Backend::DPKG;
};

// Functions
void set_root_path(const std::string& root_path);
void set_du_path(const std::string& du_path);
void set_architecture(const std::string& arch); // Manually override architecture
std::string get_architecture();

Backend parse_backend(const std::string& name);
// Missing file yields defaults. Malformed values throw PkgslimException.
Settings load_settings(const std::filesystem::path& path);
