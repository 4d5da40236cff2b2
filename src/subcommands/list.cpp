#include <string>

#include "inventory.hpp"
#include "logger.hpp"
#include "subcommands.hpp"

namespace subcommands {

Report list(const Config& config) {
    const auto repos = inventory::get_repos(config);
    Report report;
    for (const auto& repo : repos)
        report.add_message(repo.path_string());
    return report;
}

Report scan(const Config& config) {
    inventory::clear_cache(config);
    const auto repos = inventory::get_repos(config);
    log_info("Rescan complete", {{"repos", std::to_string(repos.size())}});
    Report report;
    report.add_message("Found " + std::to_string(repos.size()) +
                       " repos. Use `git global list` to show them.");
    return report;
}

} // namespace subcommands
