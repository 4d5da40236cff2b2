#include "ignore_utils.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

namespace {

void trim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

bool has_prefix(const std::string& path, std::string entry) {
    while (entry.size() > 1 && entry.back() == '/')
        entry.pop_back();
    if (entry.empty())
        return false;
    if (path == entry)
        return true;
    if (entry == "/")
        return path.front() == '/';
    return path.size() > entry.size() && path.compare(0, entry.size(), entry) == 0 &&
           path[entry.size()] == '/';
}

bool matches_any(const std::string& path, const std::vector<fs::path>& ignored) {
    if (path.empty())
        return false;
    for (const auto& entry : ignored) {
        if (has_prefix(path, entry.generic_string()))
            return true;
    }
    return false;
}

} // namespace

namespace ignore {

std::vector<fs::path> read_ignore_file(const fs::path& file) {
    std::vector<fs::path> entries;
    std::ifstream ifs(file);
    if (!ifs)
        return entries;
    std::string line;
    while (std::getline(ifs, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        entries.emplace_back(line);
    }
    return entries;
}

bool append_ignore_entry(const fs::path& file, const fs::path& entry, std::string& error) {
    std::error_code ec;
    if (file.has_parent_path()) {
        fs::create_directories(file.parent_path(), ec);
        if (ec) {
            error = "Could not create " + file.parent_path().string() + ": " + ec.message();
            return false;
        }
    }
    std::ofstream ofs(file, std::ios::app);
    if (!ofs) {
        error = "Could not open " + file.string() + " for writing";
        return false;
    }
    ofs << entry.string() << '\n';
    ofs.flush();
    if (!ofs) {
        error = "Could not write to " + file.string();
        return false;
    }
    return true;
}

bool matches_pattern(const fs::path& path, const std::vector<std::string>& patterns) {
    const std::string full = path.string();
    for (const auto& pat : patterns) {
        if (!pat.empty() && full.find(pat) != std::string::npos)
            return true;
    }
    return false;
}

bool matches_ignored(const fs::path& path, const std::vector<fs::path>& ignored) {
    if (ignored.empty())
        return false;
    if (matches_any(path.generic_string(), ignored))
        return true;
    std::error_code ec;
    fs::path canon = fs::canonical(path, ec);
    if (ec)
        return false;
    return matches_any(canon.generic_string(), ignored);
}

bool is_excluded(const fs::path& path, const std::vector<std::string>& patterns,
                 const std::vector<fs::path>& ignored) {
    return matches_pattern(path, patterns) || matches_ignored(path, ignored);
}

} // namespace ignore
