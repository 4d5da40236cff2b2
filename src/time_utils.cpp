#include "time_utils.hpp"
#include <chrono>
#include <ctime>
#include <system_error>

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

std::string format_age(std::chrono::seconds dur) {
    long long total = dur.count();
    if (total < 0)
        total = 0;
    long long d = total / 86400;
    long long h = (total / 3600) % 24;
    long long m = (total / 60) % 60;
    long long s = total % 60;
    return std::to_string(d) + "d, " + std::to_string(h) + "h, " + std::to_string(m) + "m, " +
           std::to_string(s) + "s";
}

std::optional<std::chrono::seconds> file_age(const std::filesystem::path& file) {
    std::error_code ec;
    auto mtime = std::filesystem::last_write_time(file, ec);
    if (ec)
        return std::nullopt;
    auto now = std::filesystem::file_time_type::clock::now();
    if (mtime > now)
        return std::nullopt;
    return std::chrono::duration_cast<std::chrono::seconds>(now - mtime);
}
