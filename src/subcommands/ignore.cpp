#include <filesystem>
#include <string>

#include "errors.hpp"
#include "inventory.hpp"
#include "subcommands.hpp"

namespace fs = std::filesystem;

namespace subcommands {

Report ignore(const Config& config, const std::string& path) {
    if (path.empty())
        throw CommandError("ignore requires a path argument");
    fs::path target = expand_home(path);
    std::string error;
    if (!inventory::ignore_repo(config, target, error))
        throw CommandError(error);
    Report report;
    report.add_message("Ignored repo: " + target.string());
    return report;
}

Report ignored(const Config& config) {
    const auto entries = inventory::get_ignored_repos(config);
    Report report;
    if (entries.empty()) {
        report.add_message("No repos are currently ignored.");
        return report;
    }
    report.add_message("Ignored repos (" + std::to_string(entries.size()) + "):");
    for (const auto& entry : entries)
        report.add_message("  " + entry.string());
    return report;
}

} // namespace subcommands
