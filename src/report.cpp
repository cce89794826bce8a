#include "report.hpp"
#include <algorithm>

namespace fs = std::filesystem;

/**
 * @brief Build the ANSI color palette used by the report.
 *
 * @param no_colors When true, all color codes are suppressed.
 * @param theme     Default set of color codes.
 * @return Struct containing the escape sequences to use for each color.
 */
ReportColors make_report_colors(bool no_colors, const ReportTheme& theme) {
    if (no_colors)
        return {};
    return {theme.reset, theme.red, theme.yellow, theme.blue};
}

std::string relative_display(const fs::path& path, const fs::path& base) {
    fs::path rel = path.lexically_relative(base);
    if (rel.empty())
        return path.string();
    if (rel == ".")
        return ".";
    return rel.string();
}

std::string render_repo_line(const RepositoryResult& result, const fs::path& base,
                             bool show_ahead, const ReportColors& colors) {
    std::string line = " ";
    if (result.dirty)
        line += colors.red + "*" + colors.reset;
    else
        line += " ";
    line += " " + relative_display(result.path, base);
    if (result.local_only)
        line += " " + colors.yellow + "[local]" + colors.reset;
    if (show_ahead) {
        // Unknown ahead counts are shown as zero.
        line += " " + colors.blue + "[\xE2\x86\x91" + std::to_string(result.ahead.value_or(0)) +
                "]" + colors.reset;
    }
    return line;
}

std::string render_summary(const std::vector<RepositoryResult>& results) {
    auto dirty = std::count_if(results.begin(), results.end(),
                               [](const RepositoryResult& r) { return r.dirty; });
    auto local = std::count_if(results.begin(), results.end(),
                               [](const RepositoryResult& r) { return r.local_only; });
    return std::to_string(results.size()) + " repos, " + std::to_string(dirty) + " dirty, " +
           std::to_string(local) + " local-only";
}

void print_report(std::ostream& out, const std::vector<RepositoryResult>& results,
                  const fs::path& base, const ReportOptions& opts, const ReportColors& colors) {
    for (const auto& r : results) {
        if (opts.raw)
            out << relative_display(r.path, base) << "\n";
        else
            out << render_repo_line(r, base, opts.show_ahead, colors) << "\n";
    }
    if (!opts.raw)
        out << "\n" << render_summary(results) << "\n";
    out.flush();
}
