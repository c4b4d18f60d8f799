#include "config.hpp"
#include "disk_usage.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "package_source.hpp"
#include "report.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <iostream>
#include <memory>
#include <string>

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
}

int main(int argc, char* argv[]) {
    try {
        init_localization();

        cxxopts::Options options(argv[0], get_string("info.description"));
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("help.help"))
            ("d,debug", get_string("help.debug"), cxxopts::value<bool>()->default_value("false"))
            ("n,num", get_string("help.max_results"), cxxopts::value<long long>())
            ("explore-var", get_string("help.explore_var"), cxxopts::value<bool>()->default_value("false"))
            ("backend", get_string("help.backend"), cxxopts::value<std::string>())
            ("root", get_string("help.root_dir"), cxxopts::value<std::string>())
            ("config", get_string("help.config_file"), cxxopts::value<std::string>())
            ("max-depth", get_string("help.max_depth"), cxxopts::value<int>())
            ("arch", get_string("help.target_arch"), cxxopts::value<std::string>());

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (result.count("root")) {
            set_root_path(result["root"].as<std::string>());
        }

        if (result.count("arch")) {
            set_architecture(result["arch"].as<std::string>());
        }

        Settings settings = load_settings(result.count("config") ? std::filesystem::path(result["config"].as<std::string>()) : SETTINGS_FILE);

        // Command line overrides the settings file
        if (result["debug"].as<bool>()) settings.verbose = true;
        if (result["explore-var"].as<bool>()) settings.explore_var = true;
        if (result.count("backend")) settings.backend = parse_backend(result["backend"].as<std::string>());
        if (result.count("num")) {
            long long n = result["num"].as<long long>();
            if (n < 0) throw PkgslimException(string_format("error.invalid_max_results", n));
            settings.max_results = static_cast<std::size_t>(n);
        }
        if (result.count("max-depth")) {
            int depth = result["max-depth"].as<int>();
            if (depth < 1) throw PkgslimException(string_format("error.invalid_max_depth", depth));
            settings.max_depth = depth;
        }

        set_verbose_mode(settings.verbose);

        if (settings.explore_var && !is_running_as_root()) {
            log_warning(get_string("warning.explore_var_not_root"));
        }

        std::unique_ptr<PackageSource> source = make_package_source(settings.backend, settings.explore_var);

        ReportOptions report_options;
        report_options.max_results = settings.max_results;
        report_options.blame.max_depth = settings.max_depth;
        report_options.blame.trace = get_verbose_mode();

        SizeHook hook;
        if (settings.explore_var) hook = explore_var;

        Report report = build_report(*source, report_options, hook);

        if (get_verbose_mode()) {
            log_info(string_format("info.graph_loaded", report.package_count, report.root_count));
            log_info(string_format("info.blame_stats", report.stats.visits, report.stats.collapsed,
                                   report.stats.depth_cutoffs, report.stats.cycle_survivors,
                                   report.stats.dropped_bytes / MB));
        }

        print_summary(report.entries, std::cout);

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const PkgslimException& e) {
        log_error(string_format("error.pkgslim_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
