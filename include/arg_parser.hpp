#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Small command line parser used by `dirty`.
 *
 * Long options are written as `--flag`, `--opt value` or `--opt=value`. Short
 * options (e.g. `-d`) are translated to their long form through @a short_map
 * and may be stacked (`-dl`). Only options listed in @a value_flags take a
 * value; every other flag is boolean and never consumes the next argument,
 * so `dirty -d ~/src` keeps `~/src` as the positional scan root. A value for
 * a short option may be attached (`-L5`) or passed as the next argument
 * (`-L 5`). Everything after a bare `--` is positional.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Last value per option
    std::map<std::string, std::vector<std::string>>
        multi_options_;                      ///< All values for repeatable options
    std::vector<std::string> positional_;    ///< Positional arguments in order
    std::vector<std::string> unknown_flags_; ///< Flags not present in known_flags
    std::vector<std::string> missing_values_; ///< Value options given without a value
    std::set<std::string> known_flags_;       ///< Accepted flags (empty accepts all)
    std::map<char, std::string> short_map_;   ///< Mapping of short to long flags
    std::set<std::string> value_flags_;       ///< Flags that take a value

    bool known(const std::string& key) const {
        return known_flags_.empty() || known_flags_.count(key) > 0;
    }

    bool takes_value(const std::string& key) const { return value_flags_.count(key) > 0; }

    void record(const std::string& key) {
        if (known(key))
            flags_.insert(key);
        else
            unknown_flags_.push_back(key);
    }

    void record(const std::string& key, const std::string& val) {
        if (!known(key)) {
            unknown_flags_.push_back(key);
            return;
        }
        flags_.insert(key);
        options_[key] = val;
        multi_options_[key].push_back(val);
    }

  public:
    /**
     * @brief Parse the given command line arguments.
     *
     * @param argc        Argument count from `main`.
     * @param argv        Argument vector from `main`.
     * @param known_flags Flags considered valid. If empty, all flags are known.
     * @param short_map   Mapping from single character options to long names.
     * @param value_flags Long names of options that require a value.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::map<char, std::string>& short_map = {},
              const std::set<std::string>& value_flags = {})
        : known_flags_(known_flags), short_map_(short_map), value_flags_(value_flags) {
        bool only_positional = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (only_positional) {
                positional_.push_back(arg);
            } else if (arg == "--") {
                only_positional = true;
            } else if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                if (eq != std::string::npos) {
                    record(arg.substr(0, eq), arg.substr(eq + 1));
                } else if (takes_value(arg)) {
                    if (i + 1 < argc)
                        record(arg, argv[++i]);
                    else
                        missing_values_.push_back(arg);
                } else {
                    record(arg);
                }
            } else if (arg.size() >= 2 && arg[0] == '-') {
                for (size_t j = 1; j < arg.size(); ++j) {
                    auto it = short_map_.find(arg[j]);
                    if (it == short_map_.end()) {
                        unknown_flags_.push_back(std::string("-") + arg[j]);
                        continue;
                    }
                    const std::string& key = it->second;
                    if (!takes_value(key)) {
                        record(key);
                        continue;
                    }
                    std::string rest = arg.substr(j + 1);
                    if (!rest.empty() && rest[0] == '=')
                        rest.erase(0, 1);
                    if (!rest.empty())
                        record(key, rest);
                    else if (i + 1 < argc)
                        record(key, argv[++i]);
                    else
                        missing_values_.push_back(key);
                    break;
                }
            } else {
                positional_.push_back(arg);
            }
        }
    }

    /**
     * @brief Check whether a flag was provided on the command line.
     *
     * @param flag Flag name including the leading `--`.
     */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /**
     * @brief Retrieve the last value given for an option.
     *
     * @param opt Option name including the leading `--`.
     * @return Stored value or an empty string if the option was not given.
     */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    /// @return Every value given for a repeatable option, in order.
    std::vector<std::string> get_all_options(const std::string& opt) const {
        auto it = multi_options_.find(opt);
        if (it != multi_options_.end())
            return it->second;
        return {};
    }

    const std::vector<std::string>& positional() const { return positional_; }
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }

    /// @return Value options that appeared last on the line without a value.
    const std::vector<std::string>& missing_values() const { return missing_values_; }
};

#endif // ARG_PARSER_HPP
