#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <string>
#include <set>
#include <vector>
#include <map>

/**
 * @brief Simple command line argument parser.
 *
 * The parser recognizes long style options (`--flag`, `--opt value` and
 * `--opt=value`) and short options mapped to their long counterparts
 * (`-v`, stacked as `-vj`). Only options listed in @a value_options consume
 * the following argument, so a subcommand after a boolean flag is kept as a
 * positional argument. Flags missing from @a known_flags are collected and
 * reported separately. A lone `--` ends option parsing.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::vector<std::string> positional_;        ///< Positional arguments in order
    std::vector<std::string> unknown_flags_;     ///< Flags not present in known_flags
    std::vector<std::string> missing_values_;    ///< Value options given without a value
    std::set<std::string> known_flags_;          ///< List of accepted flags
    std::set<std::string> value_options_;        ///< Flags that take a value
    std::map<char, std::string> short_map_;      ///< Mapping of short to long flags

    bool accept(const std::string& key) {
        if (known_flags_.empty() || known_flags_.count(key))
            return true;
        unknown_flags_.push_back(key);
        return false;
    }

    void store(const std::string& key, const std::string& val) {
        if (!accept(key))
            return;
        flags_.insert(key);
        options_[key] = val;
    }

  public:
    /**
     * @brief Parse the given command line arguments.
     *
     * @param argc Argument count from `main`.
     * @param argv Argument vector from `main`.
     * @param known_flags Optional set of flags that are considered valid. If
     *        empty, all flags are treated as known.
     * @param value_options Long flags that require a value.
     * @param short_map Mapping from single character options (e.g. '-h') to
     *        their long form (e.g. '--help').
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::set<std::string>& value_options = {},
              const std::map<char, std::string>& short_map = {})
        : known_flags_(known_flags), value_options_(value_options), short_map_(short_map) {
        bool options_done = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (options_done || arg == "-" || arg.empty() || arg[0] != '-') {
                positional_.push_back(arg);
            } else if (arg == "--") {
                options_done = true;
            } else if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                if (eq != std::string::npos) {
                    store(arg.substr(0, eq), arg.substr(eq + 1));
                } else if (value_options_.count(arg)) {
                    if (i + 1 < argc)
                        store(arg, argv[++i]);
                    else
                        missing_values_.push_back(arg);
                } else if (accept(arg)) {
                    flags_.insert(arg);
                }
            } else {
                for (size_t j = 1; j < arg.size(); ++j) {
                    auto it = short_map_.find(arg[j]);
                    if (it == short_map_.end()) {
                        unknown_flags_.push_back(std::string("-") + arg[j]);
                        continue;
                    }
                    const std::string& key = it->second;
                    if (!value_options_.count(key)) {
                        if (accept(key))
                            flags_.insert(key);
                        continue;
                    }
                    std::string val = arg.substr(j + 1);
                    if (!val.empty() && val[0] == '=')
                        val.erase(0, 1);
                    if (val.empty()) {
                        if (i + 1 < argc)
                            val = argv[++i];
                        else
                            missing_values_.push_back(key);
                    }
                    if (!val.empty())
                        store(key, val);
                    break;
                }
            }
        }
    }

    /**
     * @brief Check whether a flag was provided on the command line.
     *
     * @param flag Flag name including the leading `--`.
     * @return `true` if the flag was present, otherwise `false`.
     */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /**
     * @brief Retrieve the value associated with an option.
     *
     * If the option was not provided, an empty string is returned.
     *
     * @param opt Option name including the leading `--`.
     * @return Stored option value or empty string if missing.
     */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    /** @return Set of all flags found during parsing. */
    const std::set<std::string>& flags() const { return flags_; }

    /** @return Map of option names to their parsed values. */
    const std::map<std::string, std::string>& options() const { return options_; }

    /** @return Ordered list of positional arguments. */
    const std::vector<std::string>& positional() const { return positional_; }

    /** @return Flags that were not part of @a known_flags. */
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }

    /** @return Value-taking flags that appeared last with nothing after them. */
    const std::vector<std::string>& missing_values() const { return missing_values_; }
};

#endif // ARG_PARSER_HPP
