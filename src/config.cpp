#include "config.hpp"
#include <cstdlib>
#include <sstream>
#include <system_error>
#include "parse_utils.hpp"

namespace fs = std::filesystem;

namespace {

constexpr uint64_t FNV_OFFSET = 1469598103934665603ULL;
constexpr uint64_t FNV_PRIME = 1099511628211ULL;

void hash_bytes(uint64_t& h, const std::string& s) {
    for (unsigned char c : s) {
        h ^= c;
        h *= FNV_PRIME;
    }
    // Field terminator keeps "ab"+"c" and "a"+"bc" apart.
    h ^= 0xff;
    h *= FNV_PRIME;
}

void hash_flag(uint64_t& h, bool b) { hash_bytes(h, b ? "1" : "0"); }

void hash_optional(uint64_t& h, const std::optional<fs::path>& p) {
    if (p)
        hash_bytes(h, "+" + p->string());
    else
        hash_bytes(h, "-");
}

std::vector<std::string> split_patterns(const std::string& value) {
    std::vector<std::string> out;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t b = item.find_first_not_of(" \t");
        size_t e = item.find_last_not_of(" \t");
        if (b == std::string::npos)
            continue;
        out.push_back(item.substr(b, e - b + 1));
    }
    return out;
}

fs::path normalize_dir(const fs::path& p) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    if (ec)
        abs = p;
    abs = abs.lexically_normal();
    std::string s = abs.string();
    while (s.size() > 1 && s.back() == '/')
        s.pop_back();
    return fs::path(s);
}

bool apply_flag(const std::map<std::string, std::string>& settings, const std::string& key,
                bool& target, std::string& error) {
    auto it = settings.find(key);
    if (it == settings.end())
        return true;
    bool ok = false;
    bool v = parse_bool(it->second, ok);
    if (!ok) {
        error = "Invalid boolean for " + key + ": " + it->second;
        return false;
    }
    target = v;
    return true;
}

} // namespace

fs::path expand_home(const std::string& value) {
    if (value == "~" || value.rfind("~/", 0) == 0) {
        const char* home = std::getenv("HOME");
        if (home && *home) {
            if (value == "~")
                return fs::path(home);
            return fs::path(home) / value.substr(2);
        }
    }
    return fs::path(value);
}

Config default_config() {
    Config cfg;
    const char* home = std::getenv("HOME");
    cfg.basedir = normalize_dir(home && *home ? fs::path(home) : fs::path("/"));
    return cfg;
}

bool apply_settings(Config& config, const std::map<std::string, std::string>& settings,
                    std::string& error) {
    auto it = settings.find("basedir");
    if (it != settings.end()) {
        if (it->second.empty()) {
            error = "basedir must not be empty";
            return false;
        }
        config.basedir = normalize_dir(expand_home(it->second));
    }
    if (!apply_flag(settings, "follow-symlinks", config.follow_symlinks, error) ||
        !apply_flag(settings, "same-filesystem", config.same_filesystem, error) ||
        !apply_flag(settings, "verbose", config.verbose, error) ||
        !apply_flag(settings, "show-untracked", config.show_untracked, error))
        return false;
    it = settings.find("ignore");
    if (it != settings.end())
        config.ignored_patterns = split_patterns(it->second);
    it = settings.find("default-cmd");
    if (it != settings.end()) {
        if (it->second.empty()) {
            error = "default-cmd must not be empty";
            return false;
        }
        config.default_cmd = it->second;
    }
    it = settings.find("cache-file");
    if (it != settings.end()) {
        if (it->second.empty())
            config.cache_file.reset();
        else
            config.cache_file = expand_home(it->second);
    }
    it = settings.find("ignore-file");
    if (it != settings.end()) {
        if (it->second.empty())
            config.ignore_file.reset();
        else
            config.ignore_file = expand_home(it->second);
    }
    return true;
}

uint64_t config_fingerprint(const Config& config) {
    uint64_t h = FNV_OFFSET;
    hash_bytes(h, config.basedir.string());
    hash_flag(h, config.follow_symlinks);
    hash_flag(h, config.same_filesystem);
    hash_bytes(h, std::to_string(config.ignored_patterns.size()));
    for (const auto& p : config.ignored_patterns)
        hash_bytes(h, p);
    hash_bytes(h, config.default_cmd);
    hash_flag(h, config.verbose);
    hash_flag(h, config.show_untracked);
    hash_optional(h, config.cache_file);
    hash_optional(h, config.ignore_file);
    return h;
}

fs::path default_cache_dir() {
    const char* xdg = std::getenv("XDG_CACHE_HOME");
    if (xdg && *xdg && fs::path(xdg).is_absolute())
        return fs::path(xdg) / "git-global";
    const char* home = std::getenv("HOME");
    if (home && *home)
        return fs::path(home) / ".cache" / "git-global";
    return fs::temp_directory_path() / "git-global";
}
