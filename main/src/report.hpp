#pragma once

#include "blame.hpp"
#include "package_source.hpp"
#include "summary.hpp"

#include <cstddef>
#include <vector>

struct ReportOptions {
    std::size_t max_results = DEFAULT_MAX_RESULTS;
    BlameOptions blame;
};

struct Report {
    std::vector<SummaryEntry> entries;
    BlameStats stats;
    std::size_t package_count = 0;
    std::size_t root_count = 0;
    double total_bytes = 0; // sum of own sizes after the size hook
};

// Loads the package set, applies the optional size hook, reassigns blame and
// ranks the roots. Database errors propagate before any graph is built.
Report build_report(PackageSource& source, const ReportOptions& options, const SizeHook& hook = {});
