#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include "config.hpp"
#include "logger.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 3; ///< Rotated files kept next to the log
    bool json_log = false;
    bool compress_logs = false;
};

/**
 * @brief Everything one invocation needs, resolved from all setting sources.
 */
struct Options {
    Config config;
    LoggingOptions logging;
    std::optional<std::string> subcommand; ///< Empty runs `config.default_cmd`
    std::optional<std::string> argument;   ///< Positional after the subcommand
    size_t threads = 0;                    ///< Worker limit for repository operations
    bool json = false;
    bool show_help = false;
    bool print_version = false;
};

/**
 * @brief Parse the command line and merge every settings source.
 *
 * Later sources win: built-in defaults, @p git_settings (the `[global]`
 * section of the git config), the file named by `--config-yaml` or
 * `--config-json`, then the flags themselves.
 *
 * @param argc         Argument count from `main`.
 * @param argv         Argument vector from `main`.
 * @param git_settings Settings read from git config, keyed without prefix.
 * @throws CommandError on unknown flags, invalid values, conflicting flags,
 *         unreadable config files or surplus positional arguments.
 */
Options parse_options(int argc, char* argv[],
                      const std::map<std::string, std::string>& git_settings = {});

#endif // OPTIONS_HPP
