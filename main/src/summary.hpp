#pragma once

#include "graph.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

// APT is using decimal multiples
inline constexpr double MB = 1000 * 1000.0;

struct SummaryEntry {
    std::string name;
    double size_bytes = 0;
};

// Packages with no parent deps, in name order
std::vector<const PackageNode*> pick_root_packages(const PackageGraph& graph);

// Largest first, ties by name, at most max_results entries. Expects the
// blame engine to have run so every root is still pending.
std::vector<SummaryEntry> summarize(const std::vector<const PackageNode*>& roots, std::size_t max_results);

std::string format_summary_line(const SummaryEntry& entry);
void print_summary(const std::vector<SummaryEntry>& entries, std::ostream& out);
