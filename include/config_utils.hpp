#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>
#include "report.hpp"

/**
 * @brief Load options from a YAML configuration file.
 *
 * Each scalar entry `key: value` becomes `opts["--key"] = value`. Nested maps
 * act as categories and are flattened, so
 *
 * @code
 * Filters:
 *   dirty: true
 * max-depth: 5
 * @endcode
 *
 * yields `--dirty=true` and `--max-depth=5`. A sequence of scalars is joined
 * with commas.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param opts  Map receiving option values keyed by long flag name.
 * @param error Receives a human-readable message on failure.
 * @return `true` if the configuration was loaded successfully.
 */
bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load options from a JSON configuration file.
 *
 * Same layout rules as load_yaml_config().
 *
 * @param path  Filesystem path to the JSON configuration file.
 * @param opts  Map receiving option values keyed by long flag name.
 * @param error Receives a human-readable message on failure.
 * @return `true` if the configuration was loaded successfully.
 */
bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load report color overrides.
 *
 * The file is parsed as JSON when its extension is `.json` and as YAML
 * otherwise. Recognised keys: reset, red, yellow, blue.
 *
 * @param path  Filesystem path to the theme file.
 * @param theme Theme updated in place.
 * @param error Receives a human-readable message on failure.
 * @return `true` if the theme was loaded successfully.
 */
bool load_theme(const std::string& path, ReportTheme& theme, std::string& error);

#endif // CONFIG_UTILS_HPP
