#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

// Bytes used by a directory tree as reported by `du -bs`. Returns 0 when the
// path is not a directory or du fails; failures are logged, never thrown.
std::uint64_t disk_usage(const std::filesystem::path& path);

// True for logical paths of exactly the form /var/{lib,cache,log}/<name>
bool is_var_state_path(std::string_view logical_path);

// Size hook accounting for runtime state under /var/lib, /var/cache and
// /var/log that dpkg does not track in Installed-Size.
std::uint64_t explore_var(const std::vector<std::string>& installed_files);
