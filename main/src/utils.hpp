#pragma once

#include "exception.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);
// Indented diagnostic line on stdout, two spaces per depth level
void log_trace(int depth, std::string_view msg);

void set_verbose_mode(bool enable);
bool get_verbose_mode();

// System checks
bool is_running_as_root();

struct CommandResult {
    int exit_code = -1;
    std::string output; // stdout and stderr, interleaved
};

// Runs argv[0] (absolute path) without a shell and captures its output.
// Throws PkgslimException if the process cannot be spawned.
CommandResult run_command(const std::vector<std::string>& argv);

// Filesystem utilities
std::vector<std::string> read_lines(const fs::path& path);
std::string trim(std::string_view s);
