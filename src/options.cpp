#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include "arg_parser.hpp"
#include "options.hpp"

namespace {

const std::set<std::string> kKnownFlags{
    "--root",        "--max-depth",   "--dirty",     "--local",         "--unpushed",
    "--raw",         "--threads",     "--single-thread", "--ignore",    "--no-colors",
    "--theme",       "--log-file",    "--log-level", "--verbose",       "--json-log",
    "--max-log-size", "--compress-logs", "--config-yaml", "--config-json", "--auto-config",
    "--help",        "--version"};

const std::set<std::string> kValueFlags{"--root",     "--max-depth",  "--threads",
                                        "--ignore",   "--theme",      "--log-file",
                                        "--log-level", "--max-log-size", "--config-yaml",
                                        "--config-json"};

// Flags that only make sense on the command line.
const std::set<std::string> kCliOnly{"--config-yaml", "--config-json", "--auto-config",
                                     "--help", "--version"};

const std::map<char, std::string> kShortFlags{{'o', "--root"},        {'L', "--max-depth"},
                                              {'d', "--dirty"},       {'l', "--local"},
                                              {'r', "--raw"},         {'t', "--threads"},
                                              {'I', "--ignore"},      {'C', "--no-colors"},
                                              {'g', "--verbose"},     {'y', "--config-yaml"},
                                              {'j', "--config-json"}, {'h', "--help"},
                                              {'V', "--version"}};

} // namespace

Options parse_options(int argc, char* argv[]) {
    ArgParser parser(argc, argv, kKnownFlags, kShortFlags, kValueFlags);
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw std::runtime_error(parser.missing_values().front() + " requires a value");

    Options opts;
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    if (opts.show_help || opts.print_version)
        return opts;

    std::map<std::string, std::string> cfg_opts;
    load_config_files(parser, cfg_opts, opts.config_file);
    opts.auto_config = parser.has_flag("--auto-config");
    for (const auto& kv : cfg_opts) {
        if (!kKnownFlags.count(kv.first))
            throw std::runtime_error("Unknown option in config: " + kv.first);
        if (kCliOnly.count(kv.first))
            throw std::runtime_error("Option not allowed in config: " + kv.first);
    }

    auto cfg_flag = [&](const std::string& k) {
        auto it = cfg_opts.find(k);
        if (it == cfg_opts.end())
            return false;
        std::string v = it->second;
        std::transform(v.begin(), v.end(), v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return v == "" || v == "1" || v == "true" || v == "yes" || v == "on";
    };
    auto cfg_opt = [&](const std::string& k) {
        auto it = cfg_opts.find(k);
        if (it != cfg_opts.end())
            return it->second;
        return std::string();
    };

    parse_scan_options(opts, parser, cfg_flag, cfg_opt, cfg_opts);
    parse_logging_and_display(opts, parser, cfg_flag, cfg_opt, cfg_opts);
    return opts;
}
