// options/display.cpp
//
// Parse logging and report presentation flags.

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

void parse_logging_and_display(Options& opts, const ArgParser& parser,
                               const ConfigFlagFn& cfg_flag, const ConfigOptFn& cfg_opt,
                               const std::map<std::string, std::string>& cfg_opts) {
    if (parser.has_flag("--log-file") || cfg_opts.count("--log-file")) {
        std::string val = parser.get_option("--log-file");
        if (val.empty())
            val = cfg_opt("--log-file");
        if (val.empty())
            throw std::runtime_error("--log-file requires a path");
        opts.logging.log_file = val;
    }
    if (parser.has_flag("--log-level") || cfg_opts.count("--log-level")) {
        std::string val = parser.get_option("--log-level");
        if (val.empty())
            val = cfg_opt("--log-level");
        if (!parse_log_level(val, opts.logging.log_level))
            throw std::runtime_error("Invalid value for --log-level");
    }
    if (parser.has_flag("--verbose") || cfg_flag("--verbose"))
        opts.logging.log_level = LogLevel::DEBUG;
    if (parser.has_flag("--max-log-size") || cfg_opts.count("--max-log-size")) {
        std::string val = parser.get_option("--max-log-size");
        if (val.empty())
            val = cfg_opt("--max-log-size");
        bool ok = false;
        opts.logging.max_log_size = parse_bytes(val, 0, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }
    opts.logging.json_log = parser.has_flag("--json-log") || cfg_flag("--json-log");
    opts.logging.compress_logs = parser.has_flag("--compress-logs") || cfg_flag("--compress-logs");

    opts.no_colors = parser.has_flag("--no-colors") || cfg_flag("--no-colors");
    if (parser.has_flag("--theme") || cfg_opts.count("--theme")) {
        std::string val = parser.get_option("--theme");
        if (val.empty())
            val = cfg_opt("--theme");
        if (val.empty())
            throw std::runtime_error("--theme requires a file");
        std::string err;
        if (!load_theme(val, opts.theme, err))
            throw std::runtime_error("Failed to load theme: " + err);
        opts.theme_file = val;
    }
}
