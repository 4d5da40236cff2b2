#include "test_common.hpp"
#include <algorithm>

namespace {

void stage(const fs::path& repo, const std::string& file) {
    git_repository* raw = nullptr;
    REQUIRE(git_repository_open(&raw, repo.string().c_str()) == 0);
    git::repo_ptr r(raw);
    git_index* idx = nullptr;
    REQUIRE(git_repository_index(&idx, r.get()) == 0);
    REQUIRE(git_index_add_bypath(idx, file.c_str()) == 0);
    REQUIRE(git_index_write(idx) == 0);
    git_index_free(idx);
}

bool contains(const std::vector<std::string>& lines, const std::string& line) {
    return std::find(lines.begin(), lines.end(), line) != lines.end();
}

} // namespace

TEST_CASE("short_status formats index and worktree columns") {
    REQUIRE(git::short_status("f", GIT_STATUS_WT_NEW) == "?? f");
    REQUIRE(git::short_status("f", GIT_STATUS_INDEX_NEW) == "A  f");
    REQUIRE(git::short_status("f", GIT_STATUS_INDEX_NEW | GIT_STATUS_WT_MODIFIED) == "AM f");
    REQUIRE(git::short_status("f", GIT_STATUS_INDEX_MODIFIED) == "M  f");
    REQUIRE(git::short_status("f", GIT_STATUS_WT_MODIFIED) == " M f");
    REQUIRE(git::short_status("f", GIT_STATUS_WT_DELETED) == " D f");
    REQUIRE(git::short_status("f", GIT_STATUS_INDEX_DELETED) == "D  f");
    REQUIRE(git::short_status("f", GIT_STATUS_INDEX_RENAMED) == "R  f");
    REQUIRE(git::short_status("f", GIT_STATUS_WT_TYPECHANGE) == " T f");
    REQUIRE(git::short_status("f", GIT_STATUS_IGNORED) == "!! f");
    REQUIRE(git::short_status("f", GIT_STATUS_CONFLICTED | GIT_STATUS_WT_MODIFIED) == "CC f");
    REQUIRE(git::short_status("f", GIT_STATUS_CURRENT) == "   f");
}

TEST_CASE("is_git_repo requires a repository at the path itself") {
    git::GitInitGuard guard;
    fs::path dir = fresh_dir("gg_git_isrepo");
    REQUIRE_FALSE(git::is_git_repo(dir));
    init_repo(dir / "r");
    fs::create_directories(dir / "r" / "sub");
    REQUIRE(git::is_git_repo(dir / "r"));
    REQUIRE_FALSE(git::is_git_repo(dir / "r" / "sub"));
    REQUIRE_FALSE(git::is_git_repo(dir / "missing"));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Status lines respect scope and untracked setting") {
    git::GitInitGuard guard;
    fs::path dir = fresh_dir("gg_git_status");
    init_repo(dir);
    std::ofstream(dir / "new.txt") << "hello";
    std::ofstream(dir / "added.txt") << "staged";
    stage(dir, "added.txt");

    auto both = git::get_status_lines(dir, git::StatusScope::IndexAndWorkdir, true);
    REQUIRE(both);
    REQUIRE(both->size() == 2);
    REQUIRE(contains(*both, "?? new.txt"));
    REQUIRE(contains(*both, "A  added.txt"));

    auto tracked_only = git::get_status_lines(dir, git::StatusScope::IndexAndWorkdir, false);
    REQUIRE(tracked_only);
    REQUIRE(*tracked_only == std::vector<std::string>{"A  added.txt"});

    auto index = git::get_status_lines(dir, git::StatusScope::Index, true);
    REQUIRE(index);
    REQUIRE(*index == std::vector<std::string>{"A  added.txt"});

    std::ofstream(dir / "added.txt", std::ios::app) << " more";
    auto workdir = git::get_status_lines(dir, git::StatusScope::Workdir, false);
    REQUIRE(workdir);
    REQUIRE(*workdir == std::vector<std::string>{" M added.txt"});
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Ignored files never appear in status") {
    git::GitInitGuard guard;
    fs::path dir = fresh_dir("gg_git_status_ignored");
    init_repo(dir);
    std::ofstream(dir / ".gitignore") << "*.log\n";
    std::ofstream(dir / "debug.log") << "noise";
    auto lines = git::get_status_lines(dir, git::StatusScope::IndexAndWorkdir, true);
    REQUIRE(lines);
    REQUIRE(*lines == std::vector<std::string>{"?? .gitignore"});
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Repository operations fail softly on missing repos") {
    git::GitInitGuard guard;
    fs::path dir = fs::temp_directory_path() / "gg_git_missing_repo";
    FS_REMOVE_ALL(dir);
    std::string err;
    REQUIRE_FALSE(git::get_status_lines(dir, git::StatusScope::IndexAndWorkdir, true, &err));
    REQUIRE_FALSE(err.empty());
    err.clear();
    REQUIRE_FALSE(git::get_stash_list(dir, &err));
    REQUIRE_FALSE(err.empty());
    err.clear();
    REQUIRE_FALSE(git::is_ahead(dir, &err));
    REQUIRE_FALSE(err.empty());
}

TEST_CASE("Empty repository has no stashes and is not ahead") {
    git::GitInitGuard guard;
    fs::path dir = fresh_dir("gg_git_empty");
    init_repo(dir);
    auto stashes = git::get_stash_list(dir);
    REQUIRE(stashes);
    REQUIRE(stashes->empty());
    auto ahead = git::is_ahead(dir);
    REQUIRE(ahead);
    REQUIRE_FALSE(*ahead);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Stash list and ahead detection") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path dir = fresh_dir("gg_git_stash");
    fs::path remote = fresh_dir("gg_git_stash_remote");
    REQUIRE(git_cmd(dir, "init") == 0);
    commit_file(dir, "file.txt", "one");

    auto ahead = git::is_ahead(dir);
    REQUIRE(ahead);
    REQUIRE(*ahead);

    REQUIRE(git_cmd(remote, "init --bare") == 0);
    REQUIRE(git_cmd(dir, "remote add origin \"" + remote.string() + "\"") == 0);
    REQUIRE(git_cmd(dir, "push origin HEAD:refs/heads/main") == 0);
    REQUIRE(git_cmd(dir, "fetch origin") == 0);
    ahead = git::is_ahead(dir);
    REQUIRE(ahead);
    REQUIRE_FALSE(*ahead);

    commit_file(dir, "second.txt", "two");
    ahead = git::is_ahead(dir);
    REQUIRE(ahead);
    REQUIRE(*ahead);

    std::ofstream(dir / "file.txt", std::ios::app) << " changed";
    REQUIRE(git_cmd(dir, "-c user.email=you@example.com -c user.name=tester stash") == 0);
    auto stashes = git::get_stash_list(dir);
    REQUIRE(stashes);
    REQUIRE(stashes->size() == 1);
    REQUIRE(stashes->front().rfind("stash@{0}: ", 0) == 0);
    FS_REMOVE_ALL(dir);
    FS_REMOVE_ALL(remote);
}
