// options/scan.cpp
//
// Parse the scan root, traversal limits, concurrency and report filters.

#include <map>
#include <stdexcept>
#include <string>
#include <thread>

#include "arg_parser.hpp"
#include "ignore_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace {

constexpr size_t kMaxDepthLimit = 1024;
constexpr size_t kMaxThreads = 1024;

size_t default_concurrency() {
    unsigned int hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : hw;
}

} // namespace

void parse_scan_options(Options& opts, const ArgParser& parser, const ConfigFlagFn& cfg_flag,
                        const ConfigOptFn& cfg_opt,
                        const std::map<std::string, std::string>& cfg_opts) {
    const auto& positional = parser.positional();
    if (positional.size() > 1)
        throw std::runtime_error("Unexpected argument: " + positional[1]);
    if (parser.has_flag("--root") && !positional.empty())
        throw std::runtime_error("Scan path given twice: " + positional.front());
    std::string root;
    if (!positional.empty())
        root = positional.front();
    else if (parser.has_flag("--root"))
        root = parser.get_option("--root");
    else
        root = cfg_opt("--root");
    if (root.empty())
        throw std::runtime_error("Missing scan path");
    opts.root = root;

    bool ok = false;
    if (parser.has_flag("--max-depth") || cfg_opts.count("--max-depth")) {
        std::string val = parser.get_option("--max-depth");
        if (val.empty())
            val = cfg_opt("--max-depth");
        opts.max_depth = parse_size_t(val, 0, kMaxDepthLimit, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-depth");
    }

    opts.concurrency = default_concurrency();
    if (parser.has_flag("--threads") || cfg_opts.count("--threads")) {
        std::string val = parser.get_option("--threads");
        if (val.empty())
            val = cfg_opt("--threads");
        opts.concurrency = parse_size_t(val, 1, kMaxThreads, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --threads");
    }
    if (parser.has_flag("--single-thread") || cfg_flag("--single-thread"))
        opts.concurrency = 1;

    for (const auto& p : ignore::split_list(cfg_opt("--ignore")))
        opts.ignore_patterns.push_back(p);
    for (const auto& val : parser.get_all_options("--ignore")) {
        for (const auto& p : ignore::split_list(val))
            opts.ignore_patterns.push_back(p);
    }

    struct FilterFlag {
        const char* flag;
        bool RepoFilters::*member;
    };
    const FilterFlag filters[] = {
        {"--dirty", &RepoFilters::dirty_only},
        {"--local", &RepoFilters::local_only},
        {"--unpushed", &RepoFilters::unpushed_only},
    };
    for (const auto& f : filters)
        opts.filters.*(f.member) = parser.has_flag(f.flag) || cfg_flag(f.flag);
    opts.raw = parser.has_flag("--raw") || cfg_flag("--raw");
}
