#include "disk_usage.hpp"

#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <charconv>

namespace fs = std::filesystem;

std::uint64_t disk_usage(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        return 0;
    }

    const std::vector<std::string> cmd = {DU_BIN_PATH.string(), "-bs", path.string()};
    const std::string cmd_line = DU_BIN_PATH.string() + " -bs " + path.string();

    CommandResult result;
    try {
        result = run_command(cmd);
    } catch (const PkgslimException& e) {
        log_error(string_format("error.du_spawn_failed", cmd_line, e.what()));
        return 0;
    }

    if (result.exit_code == 0) {
        std::string_view out = result.output;
        const auto end = out.find_first_of(" \t\n");
        std::string_view field = out.substr(0, end);
        std::uint64_t size = 0;
        auto [ptr, parse_ec] = std::from_chars(field.data(), field.data() + field.size(), size);
        if (parse_ec == std::errc() && ptr == field.data() + field.size() && !field.empty()) {
            return size;
        }
    }

    log_error(string_format("error.du_failed", cmd_line, result.exit_code, trim(result.output)));
    return 0;
}

bool is_var_state_path(std::string_view logical_path) {
    // Tokens after splitting "/var/lib/name" on '/' are "", var, lib, name
    std::vector<std::string_view> tokens;
    size_t start = 0;
    while (tokens.size() < 5) {
        size_t pos = logical_path.find('/', start);
        if (pos == std::string_view::npos || tokens.size() == 4) {
            tokens.push_back(logical_path.substr(start));
            break;
        }
        tokens.push_back(logical_path.substr(start, pos - start));
        start = pos + 1;
    }
    if (tokens.size() != 4) return false;
    if (!tokens[0].empty() || tokens[1] != "var") return false;
    if (tokens[2] != "lib" && tokens[2] != "cache" && tokens[2] != "log") return false;
    return !tokens[3].empty();
}

std::uint64_t explore_var(const std::vector<std::string>& installed_files) {
    std::uint64_t size = 0;
    for (const auto& installed_fn : installed_files) {
        if (!is_var_state_path(installed_fn)) continue;
        const fs::path physical = ROOT_DIR / fs::path(installed_fn).relative_path();
        size += disk_usage(physical);
    }
    return size;
}
