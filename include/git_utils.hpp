#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * libgit2 reference-counts initialization, so guards may be nested. Every
 * function in this header assumes a guard is alive.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
    GitInitGuard(const GitInitGuard&) = delete;
    GitInitGuard& operator=(const GitInitGuard&) = delete;
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    ~GitHandle() {
        if (h)
            Free(h);
    }
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;
using status_list_ptr = GitHandle<git_status_list, git_status_list_free>;
using revwalk_ptr = GitHandle<git_revwalk, git_revwalk_free>;
using branch_iter_ptr = GitHandle<git_branch_iterator, git_branch_iterator_free>;
using config_ptr = GitHandle<git_config, git_config_free>;
using config_iter_ptr = GitHandle<git_config_iterator, git_config_iterator_free>;

/** Which side of the repository a status query covers. */
enum class StatusScope {
    Index,          ///< HEAD vs index (staged changes)
    Workdir,        ///< index vs working tree (unstaged changes)
    IndexAndWorkdir ///< both, like `git status`
};

/**
 * @brief Determine whether @p p is the working tree of a valid repository.
 *
 * Unlike a plain check for a `.git` directory this asks libgit2 to open the
 * repository, so stale or malformed metadata directories are rejected. Parent
 * directories are not searched.
 */
bool is_git_repo(const fs::path& p);

/**
 * @brief Format a libgit2 status bitmask in `git status -s` notation.
 *
 * The first column describes the index (`A`, `M`, `D`, `R`, `T`), the second
 * the working tree (`?`, `M`, `D`, `R`, `T`). An untracked file reads `??`,
 * an ignored one `!!` and a conflicted one `CC`. Unchanged sides are spaces.
 *
 * @param path   Repository-relative path of the entry.
 * @param status Combination of `git_status_t` flags.
 * @return Line of the form `XY path`.
 */
std::string short_status(const std::string& path, unsigned int status);

/**
 * @brief Collect short-format status lines for a repository.
 *
 * Ignored files are never reported.
 *
 * @param repo              Path to the working tree.
 * @param scope             Index, working tree, or both.
 * @param include_untracked Whether untracked files are listed.
 * @param error             Optional output receiving the libgit2 error.
 * @return Status lines, or `std::nullopt` if the repository cannot be read.
 */
std::optional<std::vector<std::string>> get_status_lines(const fs::path& repo, StatusScope scope,
                                                         bool include_untracked,
                                                         std::string* error = nullptr);

/**
 * @brief List stashes as `stash@{n}: <message>` lines, newest first.
 *
 * @return Stash lines, or `std::nullopt` if the repository cannot be opened.
 */
std::optional<std::vector<std::string>> get_stash_list(const fs::path& repo,
                                                       std::string* error = nullptr);

/**
 * @brief Check whether any local branch holds commits no remote has.
 *
 * Every commit reachable from a remote-tracking branch is collected; the
 * repository is ahead when at least one local branch tip is not among them.
 * A repository without remotes but with local branches is therefore ahead.
 *
 * @return The verdict, or `std::nullopt` if the repository cannot be read.
 */
std::optional<bool> is_ahead(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Read every `<section>.<key>` entry from the user's git config.
 *
 * Uses the default configuration search (global, XDG and system files).
 * Keys in the returned map have the section prefix removed and are
 * lowercase, as normalised by libgit2.
 *
 * @param section Section name such as `global`.
 * @return Key/value pairs; empty if no configuration could be opened.
 */
std::map<std::string, std::string> read_config_section(const std::string& section);

} // namespace git

#endif // GIT_UTILS_HPP
