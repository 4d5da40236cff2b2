#ifndef CONFIG_HPP
#define CONFIG_HPP
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Settings that drive discovery, caching and the subcommands.
 *
 * Built once per invocation and passed by const reference everywhere.
 * Every field takes part in @ref config_fingerprint.
 */
struct Config {
    std::filesystem::path basedir;
    bool follow_symlinks = true;
    bool same_filesystem = true;
    std::vector<std::string> ignored_patterns;
    std::string default_cmd = "status";
    bool verbose = false;
    bool show_untracked = true;
    std::optional<std::filesystem::path> cache_file;
    std::optional<std::filesystem::path> ignore_file;
};

/**
 * @brief Configuration with built-in defaults.
 *
 * `basedir` is `$HOME`, or `/` when no home directory is known.
 */
Config default_config();

/**
 * @brief Apply flat key/value settings on top of @p config.
 *
 * Recognised keys: `basedir`, `follow-symlinks`, `same-filesystem`, `ignore`
 * (comma-separated patterns, replaces the current list), `default-cmd`,
 * `verbose`, `show-untracked`, `cache-file`, `ignore-file`. Other keys are
 * left for the caller. Paths starting with `~/` are expanded against `$HOME`
 * and `basedir` is made absolute.
 *
 * @return `false` with @p error set if a value is malformed; @p config may
 *         then be partially updated.
 */
bool apply_settings(Config& config, const std::map<std::string, std::string>& settings,
                    std::string& error);

/**
 * @brief 64-bit hash over every field of @p config.
 *
 * Stable within one build only; the cache stores it to detect that the
 * configuration changed since the inventory was written.
 */
uint64_t config_fingerprint(const Config& config);

/**
 * @brief Per-user cache directory for git-global.
 *
 * `$XDG_CACHE_HOME/git-global`, falling back to `~/.cache/git-global`.
 */
std::filesystem::path default_cache_dir();

/**
 * @brief Expand a leading `~/` against `$HOME`.
 *
 * A bare `~` becomes `$HOME` itself. Without `HOME` the value is returned as is.
 */
std::filesystem::path expand_home(const std::string& value);

#endif // CONFIG_HPP
