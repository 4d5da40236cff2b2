#ifndef INVENTORY_HPP
#define INVENTORY_HPP
#include <filesystem>
#include <string>
#include <vector>

#include "config.hpp"
#include "repo.hpp"

namespace inventory {

/**
 * @brief Current list of known repositories.
 *
 * Rescans `config.basedir` and rewrites the cache when the cache is missing or
 * was written under a different configuration; otherwise reads the cache.
 * Either way, vanished and ignored repositories are left out.
 *
 * @throws std::runtime_error if the cache cannot be written.
 */
std::vector<Repo> get_repos(const Config& config);

/** Remove the cache so the next @ref get_repos rescans. */
void clear_cache(const Config& config);

/** Effective ignore file: `config.ignore_file` or `ignored.txt` beside the cache. */
std::filesystem::path ignore_file_path(const Config& config);

/** Entries of the ignore file, in file order. */
std::vector<std::filesystem::path> get_ignored_repos(const Config& config);

/**
 * @brief Add a repository to the ignore file.
 *
 * The path is canonicalized first so later matches work whichever form of
 * the path is used.
 *
 * @param config Active configuration.
 * @param path   Path as typed by the user; receives the canonical form.
 * @param error  Reason for failure: the path does not exist, is already
 *               ignored, or the file cannot be written.
 * @return `true` when the entry was appended.
 */
bool ignore_repo(const Config& config, std::filesystem::path& path, std::string& error);

} // namespace inventory

#endif // INVENTORY_HPP
