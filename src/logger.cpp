#include "logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>
#include "time_utils.hpp"

namespace fs = std::filesystem;

namespace {

struct LogMessage {
    LogLevel level;
    std::string msg;
    std::map<std::string, std::string> fields;
};

std::ofstream g_log_ofs;
std::string g_log_path; // NOLINT(runtime/string)
std::atomic<LogLevel> g_min_level{LogLevel::INFO};
std::atomic<size_t> g_max_size{0};
std::atomic<size_t> g_max_files{1};
std::atomic<bool> g_json_log{false};
std::atomic<bool> g_compress_logs{false};

std::queue<LogMessage> g_log_queue;
size_t g_in_flight = 0;
std::mutex g_queue_mtx;
std::condition_variable g_queue_cv;
std::condition_variable g_drained_cv;
bool g_running = false;
std::thread g_log_thread;
std::mutex g_init_mtx;

const char* level_label(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERR:
        return "ERROR";
    }
    return "INFO";
}

std::string json_escape(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char esc[8];
                std::snprintf(esc, sizeof(esc), "\\u%04x", static_cast<unsigned char>(c));
                out += esc;
            } else {
                out += c;
            }
            break;
        }
    }
    return out;
}

bool gzip_file(const fs::path& src, const fs::path& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.string().c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0 && gzwrite(out, buf, static_cast<unsigned int>(n)) == 0) {
            gzclose(out);
            return false;
        }
    }
    return gzclose(out) == Z_OK;
}

// Shift log.N -> log.N+1 (dropping the oldest) and move the active file to log.1.
void rotate_files() {
    std::error_code ec;
    const size_t keep = g_max_files.load();
    const std::string suffix = g_compress_logs.load() ? ".gz" : "";
    if (keep > 0) {
        fs::remove(g_log_path + "." + std::to_string(keep) + suffix, ec);
        for (size_t i = keep; i > 1; --i)
            fs::rename(g_log_path + "." + std::to_string(i - 1) + suffix,
                       g_log_path + "." + std::to_string(i) + suffix, ec);
        fs::path first = g_log_path + ".1";
        fs::rename(g_log_path, first, ec);
        if (!suffix.empty()) {
            fs::path gz = first;
            gz += suffix;
            if (gzip_file(first, gz))
                fs::remove(first, ec);
        }
    }
}

void write_log_entry(const LogMessage& m) {
    if (!g_log_ofs.is_open())
        return;
    std::string ts = timestamp();
    std::string line;
    if (g_json_log.load()) {
        line = "{\"timestamp\":\"" + json_escape(ts) + "\",\"level\":\"" + level_label(m.level) +
               "\",\"msg\":\"" + json_escape(m.msg) + "\"";
        for (const auto& [k, v] : m.fields)
            line += ",\"" + json_escape(k) + "\":\"" + json_escape(v) + "\"";
        line += "}";
    } else {
        line = "[" + ts + "] [" + level_label(m.level) + "] " + m.msg;
        for (const auto& [k, v] : m.fields)
            line += " " + k + "=" + v;
    }
    g_log_ofs << line << '\n';
    if (g_max_size.load() == 0)
        return;
    g_log_ofs.flush();
    std::error_code ec;
    auto size = fs::file_size(g_log_path, ec);
    if (ec || size <= g_max_size.load())
        return;
    g_log_ofs.close();
    rotate_files();
    g_log_ofs.open(g_log_path, std::ios::trunc);
}

void log_worker() {
    std::vector<LogMessage> batch;
    batch.reserve(16);
    std::unique_lock<std::mutex> lk(g_queue_mtx);
    while (true) {
        g_queue_cv.wait(lk, [] { return !g_log_queue.empty() || !g_running; });
        if (!g_running && g_log_queue.empty())
            break;
        while (!g_log_queue.empty() && batch.size() < 16) {
            batch.push_back(std::move(g_log_queue.front()));
            g_log_queue.pop();
        }
        g_in_flight = batch.size();
        lk.unlock();
        for (const auto& m : batch)
            write_log_entry(m);
        batch.clear();
        g_log_ofs.flush();
        lk.lock();
        g_in_flight = 0;
        g_drained_cv.notify_all();
    }
    g_log_ofs.flush();
    g_drained_cv.notify_all();
}

void stop_log_thread() {
    {
        std::lock_guard<std::mutex> qlk(g_queue_mtx);
        g_running = false;
    }
    g_queue_cv.notify_all();
    if (g_log_thread.joinable())
        g_log_thread.join();
}

void enqueue(LogLevel level, const std::string& msg,
             const std::map<std::string, std::string>& fields) {
    if (level < g_min_level.load())
        return;
    {
        std::lock_guard<std::mutex> lk(g_queue_mtx);
        if (!g_running)
            return;
        g_log_queue.push(LogMessage{level, msg, fields});
    }
    g_queue_cv.notify_one();
}

} // namespace

void init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    stop_log_thread();
    if (g_log_ofs.is_open())
        g_log_ofs.close();
    g_log_ofs.clear();
    g_max_size.store(max_size);
    g_max_files.store(max_files);
    g_log_ofs.open(path, std::ios::app);
    if (!g_log_ofs.is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        return;
    }
    g_log_path = path;
    g_min_level.store(level);
    {
        std::lock_guard<std::mutex> qlk(g_queue_mtx);
        g_running = true;
    }
    g_log_thread = std::thread(log_worker);
}

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

bool parse_log_level(const std::string& name, LogLevel& level) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lower == "debug")
        level = LogLevel::DEBUG;
    else if (lower == "info")
        level = LogLevel::INFO;
    else if (lower == "warning" || lower == "warn")
        level = LogLevel::WARNING;
    else if (lower == "error" || lower == "err")
        level = LogLevel::ERR;
    else
        return false;
    return true;
}

bool logger_initialized() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    return g_log_ofs.is_open();
}

void log_debug(const std::string& msg) { enqueue(LogLevel::DEBUG, msg, {}); }
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue(LogLevel::DEBUG, msg, fields);
}
void log_info(const std::string& msg) { enqueue(LogLevel::INFO, msg, {}); }
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue(LogLevel::INFO, msg, fields);
}
void log_warning(const std::string& msg) { enqueue(LogLevel::WARNING, msg, {}); }
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue(LogLevel::WARNING, msg, fields);
}
void log_error(const std::string& msg) { enqueue(LogLevel::ERR, msg, {}); }
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue(LogLevel::ERR, msg, fields);
}

void flush_logger() {
    std::unique_lock<std::mutex> lk(g_queue_mtx);
    g_drained_cv.wait(lk, [] { return !g_running || (g_log_queue.empty() && g_in_flight == 0); });
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    stop_log_thread();
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    std::lock_guard<std::mutex> qlk(g_queue_mtx);
    std::queue<LogMessage>().swap(g_log_queue);
}
