#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Interchangeable names satisfying a single requirement (OR semantics)
using DependencyGroup = std::vector<std::string>;

struct PackageRecord {
    std::string name;
    std::uint64_t own_size = 0; // bytes
    std::vector<DependencyGroup> dependency_groups;
    // Logical absolute paths, filled only when a source is asked for them
    std::vector<std::string> installed_files;
};
