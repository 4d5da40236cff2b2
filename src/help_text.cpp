#include "help_text.hpp"
#include <algorithm>
#include <iomanip>
#include <map>
#include <cstring>
#include <string>
#include "subcommands.hpp"

const std::vector<OptionInfo>& option_table() {
    static const std::vector<OptionInfo> opts = {
        {"--json", "-j", "", "Output subcommand results in JSON", "Output"},
        {"--verbose", "-v", "", "Enable verbose mode", "Output"},
        {"--untracked", "-u", "", "Show untracked files in output", "Output"},
        {"--nountracked", "-t", "", "Don't show untracked files in output", "Output"},
        {"--threads", "", "<n>", "Maximum repositories processed at once", "Concurrency"},
        {"--config-yaml", "-y", "<file>", "Load settings from YAML file", "Config"},
        {"--config-json", "", "<file>", "Load settings from JSON file", "Config"},
        {"--log-file", "-l", "<path>", "Write a log to this file", "Logging"},
        {"--log-level", "-L", "<level>", "Set log verbosity", "Logging"},
        {"--json-log", "", "", "Write log entries as JSON", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate --log-file when over this size", "Logging"},
        {"--max-log-files", "", "<n>", "Rotated log files to keep", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--version", "-V", "", "Print program version and exit", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"}};
    return opts;
}

void print_help(std::ostream& os, const char* prog) {
    const auto& opts = option_table();
    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    auto render = [](const OptionInfo& o) {
        std::string flag = "  ";
        if (std::strlen(o.short_flag))
            flag += std::string(o.short_flag) + ", ";
        else
            flag += "    ";
        flag += o.long_flag;
        if (std::strlen(o.arg))
            flag += " " + std::string(o.arg);
        return flag;
    };
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, render(o).size());
    }
    for (const auto& cmd : subcommands::all())
        width = std::max(width, std::strlen(cmd.name) + 2);

    os << "git-global - Keep track of all the git repositories on your machine\n";
    os << "Settings are read from the [global] section of your git config, and\n";
    os << "optionally from a YAML or JSON file.\n\n";
    os << "Usage: " << prog << " [options] [subcommand] [path]\n\n";
    os << "Subcommands (default: status):\n";
    for (const auto& cmd : subcommands::all())
        os << std::left << std::setw(static_cast<int>(width) + 2) << ("  " + std::string(cmd.name))
           << cmd.description << "\n";
    os << "\n";
    const std::vector<std::string> order{"Basics", "Output", "Config", "Concurrency", "Logging"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        os << cat << ":\n";
        for (const auto* o : groups[cat])
            os << std::left << std::setw(static_cast<int>(width) + 2) << render(*o) << o->desc
               << "\n";
        os << "\n";
    }
}
