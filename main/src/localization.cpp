#include "localization.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unordered_map>
#include <limits.h> // For PATH_MAX
#include <unistd.h> // For readlink

namespace fs = std::filesystem;

namespace {
    std::unordered_map<std::string, std::string> translations;
    std::unordered_map<std::string, std::string> missing_key_placeholders;

    fs::path get_executable_dir() {
        char result[PATH_MAX];
        ssize_t count = readlink("/proc/self/exe", result, PATH_MAX - 1);
        if (count != -1) {
            result[count] = '\0';
            return fs::path(result).parent_path();
        }
        log_warning("Could not determine executable path via /proc/self/exe. Falling back to current working directory.");
        return fs::current_path();
    }

    // Later catalogues override earlier ones
    bool load_strings(const std::string& lang, const fs::path& base_dir) {
        auto file_path = base_dir / (lang + ".txt");
        std::ifstream file(file_path);
        if (!file.is_open()) {
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty() || line[0] == '#') continue;
            size_t pos = line.find('=');
            if (pos != std::string::npos) {
                translations[line.substr(0, pos)] = line.substr(pos + 1);
            }
        }
        return true;
    }
}

void init_localization() {
    const char* lang_env = getenv("LANG");
    std::string lang = "en";
    if (lang_env && std::string(lang_env).starts_with("zh")) {
        lang = "zh";
    }

    fs::path l10n_dir = get_executable_dir() / ".." / "l10n";
    if (!fs::is_directory(l10n_dir)) {
        l10n_dir = PKGSLIM_L10N_DIR; // Fallback to installed path
    }

    translations.clear();
    // English first, so keys a translation lacks still resolve
    if (!load_strings("en", l10n_dir)) {
        log_warning("Could not open the English localization file in " + l10n_dir.string() + ".");
    }
    if (lang != "en" && !load_strings(lang, l10n_dir)) {
        log_warning("Could not open localization file for " + lang + ", falling back to English.");
    }
}

bool has_string(const std::string& key) {
    return translations.contains(key);
}

const std::string& get_string(const std::string& key) {
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}
