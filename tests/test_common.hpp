#pragma once
#include <catch2/catch_test_macros.hpp>
#include "arg_parser.hpp"
#include "cache.hpp"
#include "config.hpp"
#include "config_utils.hpp"
#include "git_utils.hpp"
#include "ignore_utils.hpp"
#include "inventory.hpp"
#include "logger.hpp"
#include "parse_utils.hpp"
#include "repo.hpp"
#include "scanner.hpp"
#include "time_utils.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <cstdlib>
#include <map>
#include <set>
#include <mutex>
#include <atomic>
#include <thread>
#include <chrono>
#include <vector>

#if !defined(REDIR)
#define REDIR " > /dev/null 2>&1"
#endif

static inline bool have_git() { return std::system("git --version " REDIR) == 0; }

namespace fs = std::filesystem;

namespace gitglobal::test_support {
namespace detail {
inline bool remove_once(const fs::path& target, bool recursive, std::error_code& ec) {
    ec.clear();
    if (recursive)
        fs::remove_all(target, ec);
    else
        fs::remove(target, ec);
    return !ec || ec == std::errc::no_such_file_or_directory;
}
}  // namespace detail

inline void remove_path(const fs::path& target) {
    std::error_code ec;
    if (detail::remove_once(target, false, ec))
        return;
    INFO("Failed to remove '" << target.string() << "': " << ec.message());
    REQUIRE(false);
}

inline void remove_tree(const fs::path& target) {
    std::error_code ec;
    if (detail::remove_once(target, true, ec))
        return;
    INFO("Failed to remove '" << target.string() << "': " << ec.message());
    REQUIRE(false);
}

/** Empty directory under the temp dir, returned in canonical form. */
inline fs::path fresh_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / name;
    remove_tree(dir);
    fs::create_directories(dir);
    return fs::canonical(dir);
}

/** Create an empty repository with libgit2. A guard must be alive. */
inline void init_repo(const fs::path& dir) {
    fs::create_directories(dir);
    git_repository* raw = nullptr;
    REQUIRE(git_repository_init(&raw, dir.string().c_str(), 0) == 0);
    git_repository_free(raw);
}

/** Run `git -C <repo> <args>` quietly; returns the exit status. */
inline int git_cmd(const fs::path& repo, const std::string& args) {
    std::string cmd = "git -C \"" + repo.string() + "\" " + args + REDIR;
    return std::system(cmd.c_str());
}

/** Commit a single file using the git command line. */
inline void commit_file(const fs::path& repo, const std::string& name,
                        const std::string& content) {
    std::ofstream(repo / name) << content;
    REQUIRE(git_cmd(repo, "add " + name) == 0);
    REQUIRE(git_cmd(repo, "-c user.email=you@example.com -c user.name=tester commit -m \"" +
                              name + "\"") == 0);
}

/**
 * Configuration rooted at @p basedir with the cache file inside it, as a
 * fresh checkout would use. The ignore file lands beside the cache.
 */
inline Config test_config(const fs::path& basedir) {
    Config cfg;
    cfg.basedir = basedir;
    cfg.cache_file = basedir / "test-cache-file.txt";
    return cfg;
}

inline std::vector<std::string> read_lines(const fs::path& file) {
    std::vector<std::string> lines;
    std::ifstream ifs(file);
    std::string line;
    while (std::getline(ifs, line))
        lines.push_back(line);
    return lines;
}

inline std::vector<fs::path> repo_paths(const std::vector<Repo>& repos) {
    std::vector<fs::path> out;
    for (const auto& r : repos)
        out.push_back(r.path());
    return out;
}
}  // namespace gitglobal::test_support

#ifndef FS_REMOVE
#define FS_REMOVE(path) ::gitglobal::test_support::remove_path((path))
#endif
#ifndef FS_REMOVE_ALL
#define FS_REMOVE_ALL(path) ::gitglobal::test_support::remove_tree((path))
#endif

using namespace gitglobal::test_support;
