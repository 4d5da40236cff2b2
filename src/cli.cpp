#include "cli.hpp"
#include <cstring>
#include <exception>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "git_utils.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "subcommands.hpp"
#include "version.hpp"

namespace cli {

namespace {

// Needed before parsing succeeds so that parse errors honour --json too.
bool wants_json(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        if (std::strcmp(a, "--") == 0)
            return false;
        if (std::strcmp(a, "--json") == 0)
            return true;
        if (a[0] == '-' && a[1] != '-' && std::strchr(a + 1, 'j'))
            return true;
    }
    return false;
}

struct LoggerSession {
    explicit LoggerSession(const LoggingOptions& logging) {
        if (logging.log_file.empty())
            return;
        set_json_logging(logging.json_log);
        set_log_compression(logging.compress_logs);
        init_logger(logging.log_file, logging.log_level, logging.max_log_size,
                    logging.max_log_files);
    }
    ~LoggerSession() {
        if (logger_initialized())
            shutdown_logger();
    }
    LoggerSession(const LoggerSession&) = delete;
    LoggerSession& operator=(const LoggerSession&) = delete;
};

void report_error(std::ostream& err, bool json, const std::string& message) {
    if (json) {
        nlohmann::json out = {{"error", true}, {"message", message}};
        err << out.dump(2) << std::endl;
    } else {
        err << message << std::endl;
    }
}

} // namespace

int run_from_command_line(int argc, char* argv[], std::ostream& out, std::ostream& err) {
    bool json = wants_json(argc, argv);
    std::optional<LoggerSession> session;
    try {
        Options opts = parse_options(argc, argv, git::read_config_section("global"));
        json = opts.json;
        if (opts.show_help) {
            print_help(out, argc > 0 ? argv[0] : "git-global");
            return 0;
        }
        if (opts.print_version) {
            out << "git-global " << GITGLOBAL_VERSION << "\n";
            return 0;
        }
        session.emplace(opts.logging);
        log_debug("Starting git-global", {{"basedir", opts.config.basedir.string()},
                                          {"threads", std::to_string(opts.threads)}});
        Report report =
            subcommands::run(opts.subcommand, opts.config, opts.argument, opts.threads);
        if (json)
            report.print_json(out);
        else
            report.print(out);
        return 0;
    } catch (const std::exception& e) {
        log_error(e.what());
        report_error(err, json, e.what());
        return 1;
    }
}

} // namespace cli
