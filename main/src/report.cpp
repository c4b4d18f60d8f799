#include "report.hpp"

#include "localization.hpp"
#include "utils.hpp"

Report build_report(PackageSource& source, const ReportOptions& options, const SizeHook& hook) {
    std::vector<PackageRecord> installed_packages = source.load_installed();
    if (hook) {
        log_info(get_string("info.exploring_var"));
        apply_size_hook(installed_packages, hook);
    }

    Report report;
    PackageGraph graph = build_graph(installed_packages);
    installed_packages.clear();

    report.package_count = graph.size();
    report.total_bytes = graph.pending_total();

    report.stats = BlameEngine(options.blame).run(graph);

    const auto roots = pick_root_packages(graph);
    report.root_count = roots.size();
    report.entries = summarize(roots, options.max_results);
    return report;
}
