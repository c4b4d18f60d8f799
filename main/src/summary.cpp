#include "summary.hpp"

#include <algorithm>
#include <format>

std::vector<const PackageNode*> pick_root_packages(const PackageGraph& graph) {
    std::vector<const PackageNode*> roots;
    for (const auto& [name, node] : graph.nodes()) {
        if (node.is_root()) roots.push_back(&node);
    }
    return roots;
}

std::vector<SummaryEntry> summarize(const std::vector<const PackageNode*>& roots, std::size_t max_results) {
    std::vector<SummaryEntry> entries;
    entries.reserve(roots.size());
    for (const auto* node : roots) {
        entries.push_back({node->name, node->size()});
    }

    std::sort(entries.begin(), entries.end(), [](const SummaryEntry& a, const SummaryEntry& b) {
        if (a.size_bytes != b.size_bytes) return a.size_bytes > b.size_bytes;
        return a.name < b.name;
    });

    if (entries.size() > max_results) entries.resize(max_results);
    return entries;
}

std::string format_summary_line(const SummaryEntry& entry) {
    return std::format("{:<35}  {:5.1f} MB", entry.name, entry.size_bytes / MB);
}

void print_summary(const std::vector<SummaryEntry>& entries, std::ostream& out) {
    for (const auto& entry : entries) {
        out << format_summary_line(entry) << '\n';
    }
    out << '\n';
}
