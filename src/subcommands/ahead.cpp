#include <optional>
#include <string>

#include "executor.hpp"
#include "git_utils.hpp"
#include "inventory.hpp"
#include "subcommands.hpp"

namespace subcommands {

Report ahead(const Config& config, size_t workers) {
    const auto repos = inventory::get_repos(config);
    Report report(repos);
    struct AheadResult {
        std::optional<bool> ahead;
        std::string error;
    };
    auto results = run_parallel(repos, workers, [](const Repo& repo) {
        AheadResult r;
        r.ahead = git::is_ahead(repo.path(), &r.error);
        return r;
    });
    for (const auto& [path, result] : results) {
        if (!result.ahead) {
            warn_unreadable(path, result.error);
            continue;
        }
        // An empty line lists the repository without printing anything below it.
        if (*result.ahead)
            report.add_repo_message(path, "");
    }
    return report;
}

} // namespace subcommands
