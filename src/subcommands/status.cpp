#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "executor.hpp"
#include "git_utils.hpp"
#include "inventory.hpp"
#include "logger.hpp"
#include "subcommands.hpp"

namespace fs = std::filesystem;

namespace subcommands {

namespace {

struct StatusResult {
    std::optional<std::vector<std::string>> lines;
    std::string error;
};

Report status_report(const Config& config, size_t workers, git::StatusScope scope) {
    const auto repos = inventory::get_repos(config);
    Report report(repos);
    report.pad_repo_output();
    const bool untracked = config.show_untracked;
    auto results = run_parallel(repos, workers, [scope, untracked](const Repo& repo) {
        StatusResult r;
        r.lines = git::get_status_lines(repo.path(), scope, untracked, &r.error);
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

} // namespace

void warn_unreadable(const fs::path& repo, const std::string& error) {
    std::cerr << "Could not open " << repo.string()
              << " as a git repo. Perhaps you should run `git global scan` again." << std::endl;
    log_warning("Could not open repository", {{"path", repo.string()}, {"error", error}});
}

Report status(const Config& config, size_t workers) {
    return status_report(config, workers, git::StatusScope::IndexAndWorkdir);
}

Report staged(const Config& config, size_t workers) {
    return status_report(config, workers, git::StatusScope::Index);
}

Report unstaged(const Config& config, size_t workers) {
    return status_report(config, workers, git::StatusScope::Workdir);
}

} // namespace subcommands
