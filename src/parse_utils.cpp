#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <stdexcept>

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    if (value.empty() ||
        !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); }))
        return 0;
    try {
        unsigned long long v = std::stoull(value);
        if (v < min || v > max)
            return 0;
        ok = true;
        return static_cast<size_t>(v);
    } catch (const std::exception&) {
        return 0;
    }
}

size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    if (value.empty())
        return 0;
    std::string val = value;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    unsigned long long mult = 1;
    auto ends_with = [&](const std::string& suf) {
        return val.size() >= suf.size() &&
               val.compare(val.size() - suf.size(), suf.size(), suf) == 0;
    };
    if (ends_with("kb")) {
        mult = 1024ull;
        val.erase(val.size() - 2);
    } else if (ends_with("mb")) {
        mult = 1024ull * 1024;
        val.erase(val.size() - 2);
    } else if (ends_with("gb")) {
        mult = 1024ull * 1024 * 1024;
        val.erase(val.size() - 2);
    } else if (ends_with("tb")) {
        mult = 1024ull * 1024 * 1024 * 1024;
        val.erase(val.size() - 2);
    } else if (ends_with("pb")) {
        mult = 1024ull * 1024 * 1024 * 1024 * 1024;
        val.erase(val.size() - 2);
    } else if (!val.empty() && val.back() == 'k') {
        mult = 1024ull;
        val.pop_back();
    } else if (!val.empty() && val.back() == 'm') {
        mult = 1024ull * 1024;
        val.pop_back();
    } else if (!val.empty() && val.back() == 'g') {
        mult = 1024ull * 1024 * 1024;
        val.pop_back();
    } else if (!val.empty() && val.back() == 'b') {
        val.pop_back();
    }
    if (val.empty() ||
        !std::all_of(val.begin(), val.end(), [](unsigned char c) { return std::isdigit(c); }))
        return 0;
    unsigned long long base = 0;
    try {
        base = std::stoull(val);
    } catch (const std::exception&) {
        return 0;
    }
    if (base > ULLONG_MAX / mult)
        return 0;
    unsigned long long total = base * mult;
    if (total < min || total > max)
        return 0;
    ok = true;
    return static_cast<size_t>(total);
}

bool parse_bool(const std::string& value, bool& ok) {
    std::string v = value;
    v.erase(v.begin(),
            std::find_if(v.begin(), v.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    v.erase(std::find_if(v.rbegin(), v.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            v.end());
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    ok = true;
    if (v == "true" || v == "yes" || v == "on" || v == "1")
        return true;
    if (v == "false" || v == "no" || v == "off" || v == "0")
        return false;
    ok = false;
    return false;
}
