#include <cstdint>
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "errors.hpp"
#include "executor.hpp"
#include "help_text.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace {

constexpr size_t MAX_THREADS = 1024;
constexpr size_t MAX_LOG_FILES = 1000;

void read_bool(const std::map<std::string, std::string>& settings, const char* key,
               bool& out) {
    auto it = settings.find(key);
    if (it == settings.end())
        return;
    bool ok = false;
    out = parse_bool(it->second, ok);
    if (!ok)
        throw CommandError(std::string("Invalid boolean for ") + key + ": " + it->second);
}

void apply_logging_settings(const std::map<std::string, std::string>& settings,
                            LoggingOptions& logging) {
    auto it = settings.find("log-file");
    if (it != settings.end())
        logging.log_file = it->second;
    it = settings.find("log-level");
    if (it != settings.end() && !parse_log_level(it->second, logging.log_level))
        throw CommandError("Invalid log level: " + it->second);
    read_bool(settings, "json-log", logging.json_log);
    read_bool(settings, "compress-logs", logging.compress_logs);
    it = settings.find("max-log-size");
    if (it != settings.end()) {
        bool ok = false;
        logging.max_log_size = parse_bytes(it->second, 0, SIZE_MAX, ok);
        if (!ok)
            throw CommandError("Invalid value for max-log-size: " + it->second);
    }
    it = settings.find("max-log-files");
    if (it != settings.end()) {
        bool ok = false;
        logging.max_log_files = parse_size_t(it->second, 1, MAX_LOG_FILES, ok);
        if (!ok)
            throw CommandError("Invalid value for max-log-files: " + it->second);
    }
}

} // namespace

Options parse_options(int argc, char* argv[],
                      const std::map<std::string, std::string>& git_settings) {
    std::set<std::string> known;
    std::set<std::string> takes_value;
    std::map<char, std::string> short_map;
    for (const auto& o : option_table()) {
        known.insert(o.long_flag);
        if (o.arg[0] != '\0')
            takes_value.insert(o.long_flag);
        if (o.short_flag[0] != '\0')
            short_map[o.short_flag[1]] = o.long_flag;
    }
    ArgParser parser(argc, argv, known, takes_value, short_map);

    Options opts;
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    opts.json = parser.has_flag("--json");
    if (!parser.unknown_flags().empty())
        throw CommandError("Unknown option: " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw CommandError("Missing value for " + parser.missing_values().front());
    if (opts.show_help || opts.print_version)
        return opts;

    if (parser.has_flag("--untracked") && parser.has_flag("--nountracked"))
        throw CommandError("--untracked and --nountracked cannot be used together");

    std::map<std::string, std::string> settings = git_settings;
    std::string error;
    if (parser.has_flag("--config-yaml")) {
        std::map<std::string, std::string> file_settings;
        const std::string path = parser.get_option("--config-yaml");
        if (!load_yaml_config(path, file_settings, error))
            throw CommandError("Failed to load config " + path + ": " + error);
        for (const auto& [k, v] : file_settings)
            settings[k] = v;
    }
    if (parser.has_flag("--config-json")) {
        std::map<std::string, std::string> file_settings;
        const std::string path = parser.get_option("--config-json");
        if (!load_json_config(path, file_settings, error))
            throw CommandError("Failed to load config " + path + ": " + error);
        for (const auto& [k, v] : file_settings)
            settings[k] = v;
    }
    if (parser.has_flag("--verbose"))
        settings["verbose"] = "true";
    if (parser.has_flag("--untracked"))
        settings["show-untracked"] = "true";
    if (parser.has_flag("--nountracked"))
        settings["show-untracked"] = "false";
    for (const char* key : {"threads", "log-file", "log-level", "max-log-size",
                            "max-log-files"}) {
        const std::string flag = std::string("--") + key;
        if (parser.has_flag(flag))
            settings[key] = parser.get_option(flag);
    }
    if (parser.has_flag("--json-log"))
        settings["json-log"] = "true";
    if (parser.has_flag("--compress-logs"))
        settings["compress-logs"] = "true";

    opts.config = default_config();
    if (!apply_settings(opts.config, settings, error))
        throw CommandError(error);
    apply_logging_settings(settings, opts.logging);

    opts.threads = default_parallelism();
    auto it = settings.find("threads");
    if (it != settings.end()) {
        bool ok = false;
        opts.threads = parse_size_t(it->second, 1, MAX_THREADS, ok);
        if (!ok)
            throw CommandError("Invalid value for threads: " + it->second);
    }

    const auto& pos = parser.positional();
    if (!pos.empty())
        opts.subcommand = pos[0];
    if (pos.size() > 1)
        opts.argument = pos[1];
    if (pos.size() > 2)
        throw CommandError("Unexpected argument: " + pos[2]);
    return opts;
}
