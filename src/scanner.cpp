#include "scanner.hpp"

#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <set>
#include <string>
#include <system_error>
#include <utility>

#include "git_utils.hpp"
#include "ignore_utils.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

namespace {

size_t term_width() {
    if (!isatty(STDERR_FILENO))
        return 80;
    winsize ws{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;
    const char* c = std::getenv("COLUMNS");
    if (c) {
        int n = std::atoi(c);
        if (n > 0)
            return static_cast<size_t>(n);
    }
    return 80;
}

void draw_progress(size_t found, const fs::path& current, size_t width) {
    std::string line = std::to_string(found) + " repos found, scanning " + current.string();
    if (width > 1 && line.size() >= width)
        line.resize(width - 1);
    std::cerr << "\r" << line << "\x1b[K" << std::flush;
}

} // namespace

std::vector<Repo> find_repos(const Config& config, const std::vector<fs::path>& ignored) {
    std::vector<Repo> result;
    const fs::path& root = config.basedir;
    std::cerr << "Scanning for git repos under " << root.string() << "; this may take a while..."
              << std::endl;
    log_info("Scanning for repositories", {{"basedir", root.string()}});

    std::error_code ec;
    if (root.empty() || !fs::is_directory(root, ec))
        return result;
    if (ignore::is_excluded(root, config.ignored_patterns, ignored))
        return result;

    struct stat root_st {};
    if (::stat(root.c_str(), &root_st) != 0)
        return result;
    std::set<std::pair<dev_t, ino_t>> visited;
    visited.emplace(root_st.st_dev, root_st.st_ino);

    const size_t width = config.verbose ? term_width() : 0;
    auto opts = fs::directory_options::skip_permission_denied;
    if (config.follow_symlinks)
        opts |= fs::directory_options::follow_directory_symlink;

    fs::recursive_directory_iterator it(root, opts, ec);
    fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) {
            ec.clear();
            continue;
        }
        const fs::path p = it->path();
        if (!it->is_directory(ec)) {
            if (ec)
                ec.clear();
            continue;
        }
        if (!config.follow_symlinks && it->is_symlink(ec))
            continue;
        if (ec) {
            ec.clear();
            continue;
        }
        struct stat st {};
        if (::stat(p.c_str(), &st) != 0) {
            it.disable_recursion_pending();
            continue;
        }
        if (config.same_filesystem && st.st_dev != root_st.st_dev) {
            it.disable_recursion_pending();
            continue;
        }
        if (!visited.emplace(st.st_dev, st.st_ino).second) {
            it.disable_recursion_pending();
            continue;
        }
        if (ignore::is_excluded(p, config.ignored_patterns, ignored)) {
            it.disable_recursion_pending();
            continue;
        }
        if (p.filename() == ".git") {
            it.disable_recursion_pending();
            if (git::is_git_repo(p.parent_path()))
                result.emplace_back(p.parent_path());
            continue;
        }
        if (config.verbose)
            draw_progress(result.size(), p, width);
    }
    if (config.verbose)
        std::cerr << "\r\x1b[K" << std::flush;

    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    log_info("Scan finished", {{"basedir", root.string()}, {"repos", std::to_string(result.size())}});
    return result;
}
