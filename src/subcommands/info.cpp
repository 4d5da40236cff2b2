#include <string>

#include "cache.hpp"
#include "inventory.hpp"
#include "subcommands.hpp"
#include "time_utils.hpp"
#include "version.hpp"

namespace subcommands {

namespace {

const char* yes_no(bool b) { return b ? "true" : "false"; }

} // namespace

Report info(const Config& config) {
    const auto repos = inventory::get_repos(config);
    Report report;
    const std::string title = std::string("git-global ") + GITGLOBAL_VERSION;
    report.add_message(title);
    report.add_message(std::string(title.size(), '='));
    report.add_message("Number of repos: " + std::to_string(repos.size()));
    report.add_message("Base directory: " + config.basedir.string());
    const auto cache_file = cache::cache_file_path(config);
    report.add_message("Cache file: " + cache_file.string());
    if (auto age = file_age(cache_file))
        report.add_message("Cache file age: " + format_age(*age));
    report.add_message("Ignore file: " + inventory::ignore_file_path(config).string());
    report.add_message("Ignored patterns:");
    for (const auto& pat : config.ignored_patterns)
        report.add_message("  " + pat);
    report.add_message("Default command: " + config.default_cmd);
    report.add_message(std::string("Show untracked: ") + yes_no(config.show_untracked));
    report.add_message(std::string("Follow symlinks: ") + yes_no(config.follow_symlinks));
    report.add_message(std::string("Same filesystem: ") + yes_no(config.same_filesystem));
    return report;
}

} // namespace subcommands
