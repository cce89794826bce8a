#include "help_text.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

namespace {

std::string flag_column(const OptionInfo& o) {
    std::string flag = "  ";
    if (std::strlen(o.short_flag))
        flag += std::string(o.short_flag) + ", ";
    else
        flag += "    ";
    flag += o.long_flag;
    if (std::strlen(o.arg))
        flag += " " + std::string(o.arg);
    return flag;
}

} // namespace

void print_help(const char* prog) {
    static const std::vector<OptionInfo> opts = {
        {"--root", "-o", "<path>", "Directory to scan (alternative to the positional path)",
         "Basics"},
        {"--max-depth", "-L", "<n>", "Max depth to search for repos (default 3)", "Basics"},
        {"--ignore", "-I", "<pattern>", "Skip directories matching pattern (repeatable)",
         "Basics"},
        {"--dirty", "-d", "", "Only show dirty repos", "Filters"},
        {"--local", "-l", "", "Only show local-only repos (no remotes)", "Filters"},
        {"--unpushed", "", "", "Only show repos with commits ahead of upstream (slower)",
         "Filters"},
        {"--raw", "-r", "", "Raw output for piping (one path per line)", "Display"},
        {"--no-colors", "-C", "", "Disable ANSI colors", "Display"},
        {"--theme", "", "<file>", "Load color overrides from YAML or JSON", "Display"},
        {"--version", "-V", "", "Print program version and exit", "Display"},
        {"--threads", "-t", "<n>", "Number of worker threads", "Concurrency"},
        {"--single-thread", "", "", "Classify repositories on one thread", "Concurrency"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--auto-config", "", "", "Use .dirty.yaml or .dirty.json from the root or cwd",
         "Config"},
        {"--log-file", "", "<path>", "Write diagnostic logs to this file", "Logging"},
        {"--log-level", "", "<level>", "Set log verbosity (DEBUG, INFO, WARNING, ERROR)",
         "Logging"},
        {"--verbose", "-g", "", "Shorthand for --log-level DEBUG", "Logging"},
        {"--json-log", "", "", "Write log entries as JSON objects", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate --log-file when over this size", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--help", "-h", "", "Show this message", "Basics"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, flag_column(o).size());
    }

    std::cout << "dirty - List git repos, their dirty status, and whether they're local-only\n\n";
    std::cout << "Usage: " << prog << " <path> [options]\n";
    std::cout << "       " << prog << " --root <path> [options]\n\n";
    const std::vector<std::string> order{"Basics", "Filters", "Display",
                                         "Concurrency", "Config", "Logging"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        std::cout << cat << ":\n";
        for (const auto* o : groups[cat]) {
            std::cout << std::left << std::setw(static_cast<int>(width) + 2) << flag_column(*o)
                      << o->desc << "\n";
        }
        std::cout << "\n";
    }
}
