#ifndef SCANNER_HPP
#define SCANNER_HPP

#include <filesystem>
#include <vector>

#include "config.hpp"
#include "repo.hpp"

/**
 * @brief Walk `config.basedir` and return every git repository below it.
 *
 * A directory is a repository when it contains a `.git` directory that
 * libgit2 can open; the working tree, not `.git`, is recorded and `.git`
 * itself is never entered. Directories excluded by `config.ignored_patterns`
 * or by @p ignored are pruned before they are classified, the root
 * included. Symlinked directories are followed only with
 * `config.follow_symlinks`, devices other than the root's are skipped with
 * `config.same_filesystem`, and a directory already visited (same device
 * and inode) is not entered twice. Unreadable entries are skipped.
 *
 * Progress goes to stderr: a start banner, and with `config.verbose` a live
 * single-line counter sized to the terminal.
 *
 * @param config  Active configuration.
 * @param ignored Canonical paths of ignored repositories.
 * @return Repositories sorted by path.
 */
std::vector<Repo> find_repos(const Config& config,
                             const std::vector<std::filesystem::path>& ignored = {});

#endif // SCANNER_HPP
