#ifndef IGNORE_UTILS_HPP
#define IGNORE_UTILS_HPP
#include <filesystem>
#include <string>
#include <vector>

namespace ignore {

/**
 * Read a list of ignored repository paths from a file.
 *
 * Each non-empty, non-comment line in the file is trimmed of leading and
 * trailing whitespace and treated as a distinct path entry. Lines beginning
 * with '#' are considered comments and skipped. If a line ends with a carriage
 * return (`\r`), it is stripped before processing. Paths are stored exactly as
 * written; `ignore` only ever appends canonical absolute paths.
 *
 * Missing or unreadable files result in an empty list of entries.
 */
std::vector<std::filesystem::path> read_ignore_file(const std::filesystem::path& file);

/**
 * Append a single entry to an ignore file.
 *
 * Parent directories are created as needed and the file is created if
 * missing. The entry is written on its own line.
 *
 * @param file  Ignore file to extend.
 * @param entry Path to record.
 * @param error Receives a description of the failure.
 * @return `true` on success.
 */
bool append_ignore_entry(const std::filesystem::path& file, const std::filesystem::path& entry,
                         std::string& error);

/**
 * Check whether a path contains any of the given substrings.
 *
 * Matching is case-sensitive and purely textual. Empty patterns never match.
 */
bool matches_pattern(const std::filesystem::path& path, const std::vector<std::string>& patterns);

/**
 * Check whether a path lies inside an ignored repository.
 *
 * A path matches an entry when it equals the entry or begins with the entry
 * followed by a directory separator, so `/x/proj` covers `/x/proj/sub` but not
 * `/x/project2`. Both the path as given and its canonical form are compared,
 * which catches symlinks that resolve into an ignored tree. A path that cannot
 * be canonicalized is compared literally only.
 */
bool matches_ignored(const std::filesystem::path& path,
                     const std::vector<std::filesystem::path>& ignored);

/**
 * Combined exclusion test used by discovery and cache reads.
 */
bool is_excluded(const std::filesystem::path& path, const std::vector<std::string>& patterns,
                 const std::vector<std::filesystem::path>& ignored);

} // namespace ignore

#endif // IGNORE_UTILS_HPP
