#pragma once

#include <string>
#include <format>
#include <string_view>

// Loads the English catalogue, then the one selected by LANG on top of it
void init_localization();

bool has_string(const std::string& key);
// Unknown keys yield a "[MISSING_STRING: key]" placeholder
const std::string& get_string(const std::string& key);

// Formats a catalogue entry with std::format placeholders
template<typename... Args>
std::string string_format(const std::string& key, Args&&... args) {
    try {
        return std::vformat(get_string(key), std::make_format_args(args...));
    } catch (const std::format_error& e) {
        return "[FORMAT_ERROR: " + key + "] " + e.what();
    }
}
