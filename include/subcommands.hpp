#ifndef SUBCOMMANDS_HPP
#define SUBCOMMANDS_HPP
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "report.hpp"

namespace subcommands {

struct SubcommandInfo {
    const char* name;
    const char* description;
};

/** Every subcommand with its one-line description, sorted by name. */
const std::vector<SubcommandInfo>& all();

/**
 * @brief Run a subcommand by name.
 *
 * @param name    Subcommand; `std::nullopt` runs `config.default_cmd`.
 * @param config  Active configuration.
 * @param arg     Positional argument (the path for `ignore`).
 * @param workers Concurrency limit for per-repository work.
 * @throws CommandError for unknown subcommands or bad arguments.
 * @throws std::runtime_error when the cache cannot be written.
 */
Report run(const std::optional<std::string>& name, const Config& config,
           const std::optional<std::string>& arg, size_t workers);

Report status(const Config& config, size_t workers);
Report staged(const Config& config, size_t workers);
Report unstaged(const Config& config, size_t workers);
Report stashed(const Config& config, size_t workers);
Report ahead(const Config& config, size_t workers);
Report list(const Config& config);
Report scan(const Config& config);
Report info(const Config& config);
Report ignore(const Config& config, const std::string& path);
Report ignored(const Config& config);

/**
 * @brief Report a repository that libgit2 could not read.
 *
 * Printed to stderr and logged; the repository is left out of the report.
 */
void warn_unreadable(const std::filesystem::path& repo, const std::string& error);

} // namespace subcommands

#endif // SUBCOMMANDS_HPP
