#ifndef CACHE_HPP
#define CACHE_HPP
#include <filesystem>
#include <vector>

#include "config.hpp"
#include "repo.hpp"

/**
 * Flat-file store for the repository inventory.
 *
 * Line 1 holds @ref config_fingerprint as decimal digits, every further line
 * one repository path. The file is only trusted when the fingerprint matches
 * the active configuration.
 */
namespace cache {

/** Effective cache file: `config.cache_file` or `<cache dir>/repos.txt`. */
std::filesystem::path cache_file_path(const Config& config);

/**
 * @brief Whether the cache exists and was written under @p config.
 */
bool is_valid(const Config& config);

/**
 * @brief Replace the cache with @p repos.
 *
 * Creates missing directories, writes a temporary sibling file and renames it
 * into place.
 *
 * @throws std::runtime_error if any step fails.
 */
void write(const Config& config, const std::vector<Repo>& repos);

/**
 * @brief Load the cached repositories.
 *
 * Paths that no longer exist, or that fall inside an @p ignored entry, are
 * dropped silently; the file itself is left untouched.
 */
std::vector<Repo> read(const Config& config, const std::vector<std::filesystem::path>& ignored);

/**
 * @brief Delete the cache file if it exists.
 *
 * @throws std::runtime_error if the file exists but cannot be removed.
 */
void clear(const Config& config);

} // namespace cache

#endif // CACHE_HPP
