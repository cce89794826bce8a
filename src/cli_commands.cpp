#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "cli_commands.hpp"
#include "filters.hpp"
#include "logger.hpp"
#include "report.hpp"
#include "scan_error.hpp"
#include "scanner.hpp"
#include "time_utils.hpp"

namespace fs = std::filesystem;

namespace cli {

namespace {

// Discovery resolves the root again; this copy is only used for display.
fs::path display_base(const fs::path& root) {
    std::error_code ec;
    fs::path base = fs::canonical(root, ec);
    return ec ? root : base;
}

} // namespace

int run_scan(const Options& opts, std::ostream& out, std::ostream& err) {
    auto start = std::chrono::steady_clock::now();
    log_debug("Scan options",
              {{"root", opts.root.string()},
               {"max_depth", std::to_string(opts.max_depth)},
               {"threads", std::to_string(opts.concurrency)},
               {"config", opts.config_file.empty() ? "-" : opts.config_file.string()},
               {"auto_config", opts.auto_config ? "true" : "false"},
               {"theme", opts.theme_file.empty() ? "-" : opts.theme_file}});
    try {
        std::vector<fs::path> repos = discover(opts.root, opts.max_depth, opts.ignore_patterns);
        fs::path base = display_base(opts.root);
        if (repos.empty())
            throw ScanError(ScanErrorKind::NoRepositoriesFound,
                            "No git repos found in " + base.string());
        log_info("Discovered repositories", {{"root", base.string()},
                                             {"count", std::to_string(repos.size())},
                                             {"max_depth", std::to_string(opts.max_depth)}});

        std::vector<RepositoryResult> results =
            scan_repos(repos, needs_ahead(opts.filters), opts.concurrency);
        std::vector<RepositoryResult> shown = apply_filters(results, opts.filters);
        if (shown.empty())
            throw ScanError(ScanErrorKind::NoMatchingRepositories, "No matching repos found");

        ReportOptions ropts;
        ropts.raw = opts.raw;
        ropts.show_ahead = opts.filters.unpushed_only;
        print_report(out, shown, base, ropts, make_report_colors(opts.no_colors, opts.theme));
        log_info("Scan complete",
                 {{"classified", std::to_string(results.size())},
                  {"shown", std::to_string(shown.size())},
                  {"elapsed", format_elapsed(std::chrono::steady_clock::now() - start)}});
        return 0;
    } catch (const ScanError& e) {
        log_error(e.what());
        err << e.what() << "\n";
        return 1;
    }
}

} // namespace cli
