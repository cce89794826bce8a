#ifndef REPORT_HPP
#define REPORT_HPP

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>
#include "repo.hpp"

/**
 * @brief Theme definition for report colors.
 *
 * Contains raw ANSI sequences; a theme file may override any of them.
 */
struct ReportTheme {
    std::string reset = "\033[0m";
    std::string red = "\033[31m";
    std::string yellow = "\033[33m";
    std::string blue = "\033[34m";
};

/**
 * @brief Resolved color codes; every member is empty when colors are off.
 */
struct ReportColors {
    std::string reset;
    std::string red;
    std::string yellow;
    std::string blue;
};

/**
 * @brief Create the palette used for printing.
 */
ReportColors make_report_colors(bool no_colors, const ReportTheme& theme);

struct ReportOptions {
    bool raw = false;        ///< One relative path per line, nothing else
    bool show_ahead = false; ///< Append the `[↑N]` marker to every line
};

/**
 * @brief Path of @a path relative to the scan root; the root itself is ".".
 */
std::string relative_display(const std::filesystem::path& path, const std::filesystem::path& base);

/**
 * @brief Render a single human-readable repository line (no trailing newline).
 *
 * Layout: ` <mark> <relative path>[ [local]][ [↑N]]` where the mark is a red
 * `*` for a dirty working tree and a space otherwise.
 */
std::string render_repo_line(const RepositoryResult& result, const std::filesystem::path& base,
                             bool show_ahead, const ReportColors& colors);

/**
 * @brief Render the totals line, e.g. "4 repos, 1 dirty, 2 local-only".
 */
std::string render_summary(const std::vector<RepositoryResult>& results);

/**
 * @brief Write the complete report for @a results to @a out.
 *
 * Human mode prints one line per repository followed by a blank line and the
 * summary. Raw mode prints only relative paths.
 */
void print_report(std::ostream& out, const std::vector<RepositoryResult>& results,
                  const std::filesystem::path& base, const ReportOptions& opts,
                  const ReportColors& colors);

#endif // REPORT_HPP
