// options/config.cpp
//
// Load configuration from YAML/JSON and auto-discovery.

#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <system_error>

#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"

namespace fs = std::filesystem;

namespace {

void load_config_file(const fs::path& path, std::map<std::string, std::string>& cfg_opts) {
    std::string err;
    bool ok = path.extension() == ".json" ? load_json_config(path.string(), cfg_opts, err)
                                          : load_yaml_config(path.string(), cfg_opts, err);
    if (!ok)
        throw std::runtime_error("Failed to load config: " + err);
}

fs::path find_auto_config(const fs::path& dir) {
    if (dir.empty())
        return {};
    std::error_code ec;
    fs::path y = dir / ".dirty.yaml";
    if (fs::exists(y, ec))
        return y;
    fs::path j = dir / ".dirty.json";
    if (fs::exists(j, ec))
        return j;
    return {};
}

} // namespace

void load_config_files(const ArgParser& parser, std::map<std::string, std::string>& cfg_opts,
                       fs::path& config_file) {
    if (parser.has_flag("--auto-config")) {
        fs::path root_hint;
        if (parser.has_flag("--root"))
            root_hint = parser.get_option("--root");
        else if (!parser.positional().empty())
            root_hint = parser.positional().front();
        fs::path cfg_path = find_auto_config(root_hint);
        if (cfg_path.empty()) {
            std::error_code ec;
            cfg_path = find_auto_config(fs::current_path(ec));
        }
        if (!cfg_path.empty()) {
            load_config_file(cfg_path, cfg_opts);
            config_file = cfg_path;
        }
    }
    // Explicit files are read after the auto-detected one so their values win.
    if (parser.has_flag("--config-yaml")) {
        std::string cfg = parser.get_option("--config-yaml");
        if (cfg.empty())
            throw std::runtime_error("--config-yaml requires a file");
        std::string err;
        if (!load_yaml_config(cfg, cfg_opts, err))
            throw std::runtime_error("Failed to load config: " + err);
        config_file = cfg;
    }
    if (parser.has_flag("--config-json")) {
        std::string cfg = parser.get_option("--config-json");
        if (cfg.empty())
            throw std::runtime_error("--config-json requires a file");
        std::string err;
        if (!load_json_config(cfg, cfg_opts, err))
            throw std::runtime_error("Failed to load config: " + err);
        config_file = cfg;
    }
}
