#include "inventory.hpp"
#include <algorithm>
#include <system_error>

#include "cache.hpp"
#include "ignore_utils.hpp"
#include "logger.hpp"
#include "scanner.hpp"

namespace fs = std::filesystem;

namespace inventory {

std::vector<Repo> get_repos(const Config& config) {
    const auto ignored = get_ignored_repos(config);
    if (!cache::is_valid(config)) {
        log_info("Cache missing or outdated, rescanning",
                 {{"cache", cache::cache_file_path(config).string()}});
        cache::write(config, find_repos(config, ignored));
    }
    return cache::read(config, ignored);
}

void clear_cache(const Config& config) { cache::clear(config); }

fs::path ignore_file_path(const Config& config) {
    if (config.ignore_file)
        return *config.ignore_file;
    return cache::cache_file_path(config).parent_path() / "ignored.txt";
}

std::vector<fs::path> get_ignored_repos(const Config& config) {
    return ignore::read_ignore_file(ignore_file_path(config));
}

bool ignore_repo(const Config& config, fs::path& path, std::string& error) {
    std::error_code ec;
    fs::path canon = fs::canonical(path, ec);
    if (ec) {
        error = "Could not resolve " + path.string() + ": " + ec.message();
        return false;
    }
    const auto existing = get_ignored_repos(config);
    if (std::find(existing.begin(), existing.end(), canon) != existing.end()) {
        error = "Repo is already ignored: " + canon.string();
        return false;
    }
    const fs::path file = ignore_file_path(config);
    if (!ignore::append_ignore_entry(file, canon, error))
        return false;
    log_info("Repository ignored", {{"path", canon.string()}, {"file", file.string()}});
    path = canon;
    return true;
}

} // namespace inventory
