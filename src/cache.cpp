#include "cache.hpp"
#include <unistd.h>

#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include "ignore_utils.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

namespace cache {

namespace {

bool parse_fingerprint(const std::string& line, uint64_t& out) {
    if (line.empty() || line.find_first_not_of("0123456789") != std::string::npos)
        return false;
    try {
        out = std::stoull(line);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

} // namespace

fs::path cache_file_path(const Config& config) {
    if (config.cache_file)
        return *config.cache_file;
    return default_cache_dir() / "repos.txt";
}

bool is_valid(const Config& config) {
    std::ifstream ifs(cache_file_path(config));
    if (!ifs)
        return false;
    std::string line;
    if (!std::getline(ifs, line))
        return false;
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    uint64_t stored = 0;
    return parse_fingerprint(line, stored) && stored == config_fingerprint(config);
}

void write(const Config& config, const std::vector<Repo>& repos) {
    const fs::path file = cache_file_path(config);
    std::error_code ec;
    if (file.has_parent_path()) {
        fs::create_directories(file.parent_path(), ec);
        if (ec)
            throw std::runtime_error("Could not create cache directory " +
                                     file.parent_path().string() + ": " + ec.message());
    }
    fs::path tmp = file;
    tmp += ".tmp." + std::to_string(::getpid());
    {
        std::ofstream ofs(tmp, std::ios::trunc);
        if (!ofs)
            throw std::runtime_error("Could not create cache file " + tmp.string());
        ofs << config_fingerprint(config) << '\n';
        for (const auto& repo : repos)
            ofs << repo.path_string() << '\n';
        ofs.flush();
        if (!ofs) {
            ofs.close();
            fs::remove(tmp, ec);
            throw std::runtime_error("Could not write cache file " + tmp.string());
        }
    }
    fs::rename(tmp, file, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        throw std::runtime_error("Could not replace cache file " + file.string() + ": " +
                                 ec.message());
    }
    log_debug("Cache written", {{"file", file.string()}, {"repos", std::to_string(repos.size())}});
}

std::vector<Repo> read(const Config& config, const std::vector<fs::path>& ignored) {
    std::vector<Repo> repos;
    const fs::path file = cache_file_path(config);
    std::ifstream ifs(file);
    if (!ifs)
        return repos;
    std::string line;
    std::getline(ifs, line); // fingerprint
    while (std::getline(ifs, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            continue;
        fs::path p(line);
        std::error_code ec;
        if (!fs::exists(p, ec)) {
            log_debug("Dropping stale cache entry", {{"path", line}});
            continue;
        }
        if (ignore::matches_ignored(p, ignored))
            continue;
        repos.emplace_back(std::move(p));
    }
    return repos;
}

void clear(const Config& config) {
    const fs::path file = cache_file_path(config);
    std::error_code ec;
    fs::remove(file, ec);
    if (ec)
        throw std::runtime_error("Could not remove cache file " + file.string() + ": " +
                                 ec.message());
}

} // namespace cache
