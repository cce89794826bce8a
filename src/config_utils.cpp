#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <cctype>
#include <fstream>
#include <sstream>

static bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    if (node.IsSequence()) {
        std::string joined;
        for (const auto& item : node) {
            if (!item.IsScalar())
                return false;
            if (!joined.empty())
                joined += ",";
            joined += item.Scalar();
        }
        out = joined;
        return true;
    }
    // Scalars keep their source spelling ("yes", "5", "DEBUG"); option
    // parsing decides how to interpret them.
    out = node.Scalar();
    return true;
}

static bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    if (v.is_array()) {
        std::string joined;
        for (const auto& item : v) {
            std::string s;
            if (item.is_array() || item.is_object() || !to_string_value(item, s))
                return false;
            if (!joined.empty())
                joined += ",";
            joined += s;
        }
        out = joined;
        return true;
    }
    return false;
}

static bool flatten_yaml(const YAML::Node& map, std::map<std::string, std::string>& opts,
                         std::string& error) {
    for (auto it = map.begin(); it != map.end(); ++it) {
        if (!it->first.IsScalar())
            continue;
        const std::string key = it->first.Scalar();
        const YAML::Node& node = it->second;
        if (node.IsMap()) {
            if (!flatten_yaml(node, opts, error))
                return false;
            continue;
        }
        std::string s;
        if (!to_string_value(node, s)) {
            error = "Unsupported value for '" + key + "'";
            return false;
        }
        opts["--" + key] = s;
    }
    return true;
}

static bool flatten_json(const nlohmann::json& obj, std::map<std::string, std::string>& opts,
                         std::string& error) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        const auto& val = it.value();
        if (val.is_object()) {
            if (!flatten_json(val, opts, error))
                return false;
            continue;
        }
        std::string s;
        if (!to_string_value(val, s)) {
            error = "Unsupported value for '" + it.key() + "'";
            return false;
        }
        opts["--" + it.key()] = s;
    }
    return true;
}

bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (root.IsNull())
            return true;
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        return flatten_yaml(root, opts, error);
    } catch (const YAML::Exception& e) {
        error = e.what();
        return false;
    }
}

bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        nlohmann::json root;
        ifs >> root;
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        return flatten_json(root, opts, error);
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return false;
    }
}

static bool assign_theme_field(const std::string& key, const std::string& val,
                               ReportTheme& theme) {
    if (key == "reset")
        theme.reset = val;
    else if (key == "red")
        theme.red = val;
    else if (key == "yellow")
        theme.yellow = val;
    else if (key == "blue")
        theme.blue = val;
    else
        return false;
    return true;
}

bool load_theme(const std::string& path, ReportTheme& theme, std::string& error) {
    std::string ext;
    auto pos = path.find_last_of('.');
    if (pos != std::string::npos)
        ext = path.substr(pos + 1);
    for (auto& c : ext)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    std::ifstream ifs(path);
    if (!ifs) {
        error = "Failed to open file";
        return false;
    }
    try {
        if (ext == "json") {
            nlohmann::json root;
            ifs >> root;
            if (!root.is_object()) {
                error = "Root JSON value is not an object";
                return false;
            }
            for (auto it = root.begin(); it != root.end(); ++it) {
                if (it.value().is_string() &&
                    !assign_theme_field(it.key(), it.value().get<std::string>(), theme)) {
                    error = "Unknown theme color: " + it.key();
                    return false;
                }
            }
            return true;
        }
        YAML::Node root = YAML::Load(ifs);
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (!it->first.IsScalar() || !it->second.IsScalar())
                continue;
            if (!assign_theme_field(it->first.Scalar(), it->second.Scalar(), theme)) {
                error = "Unknown theme color: " + it->first.Scalar();
                return false;
            }
        }
        return true;
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return false;
    } catch (const YAML::Exception& e) {
        error = e.what();
        return false;
    }
}
