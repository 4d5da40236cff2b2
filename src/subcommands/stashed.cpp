#include <optional>
#include <string>
#include <vector>

#include "executor.hpp"
#include "git_utils.hpp"
#include "inventory.hpp"
#include "subcommands.hpp"

namespace subcommands {

Report stashed(const Config& config, size_t workers) {
    const auto repos = inventory::get_repos(config);
    Report report(repos);
    report.pad_repo_output();
    struct StashResult {
        std::optional<std::vector<std::string>> lines;
        std::string error;
    };
    auto results = run_parallel(repos, workers, [](const Repo& repo) {
        StashResult r;
        r.lines = git::get_stash_list(repo.path(), &r.error);
        return r;
    });
    for (const auto& [path, result] : results) {
        if (!result.lines) {
            warn_unreadable(path, result.error);
            continue;
        }
        for (const auto& line : *result.lines)
            report.add_repo_message(path, line);
    }
    return report;
}

} // namespace subcommands
