#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "filters.hpp"
#include "logger.hpp"
#include "report.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 3;
    bool json_log = false;
    bool compress_logs = false;
};

struct Options {
    std::filesystem::path root;
    size_t max_depth = 3;
    RepoFilters filters;
    bool raw = false;
    size_t concurrency = 1;
    std::vector<std::string> ignore_patterns;
    bool no_colors = false;
    std::string theme_file;
    ReportTheme theme;
    LoggingOptions logging;
    bool auto_config = false;
    std::filesystem::path config_file;
    bool show_help = false;
    bool print_version = false;
};

class ArgParser;

using ConfigFlagFn = std::function<bool(const std::string&)>;
using ConfigOptFn = std::function<std::string(const std::string&)>;

/**
 * Parse command-line arguments and configuration files into an Options
 * instance. Command-line values take precedence over configuration values.
 *
 * @param argc Number of command-line arguments.
 * @param argv Argument vector.
 * @return Fully populated Options structure.
 * @throws std::runtime_error on unknown flags, malformed values or an
 *         unreadable configuration file.
 */
Options parse_options(int argc, char* argv[]);

/**
 * Load `--config-yaml`, `--config-json` and, with `--auto-config`, a
 * `.dirty.yaml` / `.dirty.json` found in the scan root or the current
 * directory.
 *
 * @param parser      Parsed command line.
 * @param cfg_opts    Receives the option values read from configuration.
 * @param config_file Receives the path of the last file loaded.
 * Side effects on Options: none.
 */
void load_config_files(const ArgParser& parser, std::map<std::string, std::string>& cfg_opts,
                       std::filesystem::path& config_file);

/**
 * Parse the scan root, depth, ignore patterns, concurrency and filter flags.
 *
 * Side effects on Options: updates root, max_depth, ignore_patterns,
 * concurrency, filters and raw.
 */
void parse_scan_options(Options& opts, const ArgParser& parser, const ConfigFlagFn& cfg_flag,
                        const ConfigOptFn& cfg_opt,
                        const std::map<std::string, std::string>& cfg_opts);

/**
 * Parse logging and color related flags; loads the theme file when given.
 *
 * Side effects on Options: updates logging, no_colors, theme_file and theme.
 */
void parse_logging_and_display(Options& opts, const ArgParser& parser,
                               const ConfigFlagFn& cfg_flag, const ConfigOptFn& cfg_opt,
                               const std::map<std::string, std::string>& cfg_opts);

#endif // OPTIONS_HPP
