#include "logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <queue>
#include <thread>
#include <vector>
#include "time_utils.hpp"

namespace fs = std::filesystem;

namespace {

struct LogEntry {
    LogLevel level;
    std::string msg;
    LogFields fields;
};

std::ofstream g_log_ofs;
std::string g_log_path; // NOLINT(runtime/string)
std::atomic<LogLevel> g_min_level{LogLevel::INFO};
std::atomic<std::size_t> g_max_size{0};
std::atomic<std::size_t> g_max_files{1};
std::atomic<bool> g_json_log{false};
std::atomic<bool> g_compress_logs{false};

std::queue<std::unique_ptr<LogEntry>> g_log_queue;
std::size_t g_in_flight = 0;
std::mutex g_queue_mtx;
std::condition_variable g_queue_cv;
std::condition_variable g_drained_cv;
bool g_running = false;
std::atomic<bool> g_ready{false};
std::thread g_log_thread;
std::mutex g_init_mtx;

void log_worker();

void stop_log_thread() {
    {
        std::lock_guard<std::mutex> lk(g_queue_mtx);
        g_running = false;
    }
    g_queue_cv.notify_all();
    if (g_log_thread.joinable())
        g_log_thread.join();
}

bool gzip_file(const fs::path& src, const fs::path& dst) {
    std::ifstream in(src, std::ios::binary);
    if (!in.is_open())
        return false;
    gzFile out = gzopen(dst.string().c_str(), "wb");
    if (out == nullptr)
        return false;
    char buf[8192];
    bool ok = true;
    while (in && ok) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0 && gzwrite(out, buf, static_cast<unsigned int>(n)) == 0)
            ok = false;
    }
    if (gzclose(out) != Z_OK)
        ok = false;
    return ok;
}

fs::path rotated_name(std::size_t index, bool compressed) {
    std::string name = g_log_path + "." + std::to_string(index);
    if (compressed)
        name += ".gz";
    return name;
}

// Shift <log>.N to <log>.N+1, dropping the oldest, then move the active file
// to <log>.1 (gzipped when compression is on).
void rotate_files() {
    std::error_code ec;
    std::size_t keep = g_max_files.load();
    bool compress = g_compress_logs.load();
    g_log_ofs.close();
    if (keep > 0) {
        fs::remove(rotated_name(keep, compress), ec);
        for (std::size_t i = keep; i > 1; --i)
            fs::rename(rotated_name(i - 1, compress), rotated_name(i, compress), ec);
        fs::path first = rotated_name(1, false);
        fs::rename(g_log_path, first, ec);
        if (compress && !ec) {
            if (gzip_file(first, rotated_name(1, true)))
                fs::remove(first, ec);
        }
    }
    g_log_ofs.open(g_log_path, std::ios::trunc);
}

std::string format_entry(const LogEntry& e) {
    std::string ts = timestamp();
    if (g_json_log.load()) {
        nlohmann::json j;
        j["timestamp"] = ts;
        j["level"] = level_label(e.level);
        j["msg"] = e.msg;
        for (const auto& [k, v] : e.fields)
            j[k] = v;
        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    std::string line = "[" + ts + "] [" + level_label(e.level) + "] " + e.msg;
    for (const auto& [k, v] : e.fields)
        line += " " + k + "=" + v;
    return line;
}

void write_log_entry(const LogEntry& e) {
    if (!g_log_ofs.is_open() || e.level < g_min_level.load())
        return;
    g_log_ofs << format_entry(e) << '\n';
    if (g_max_size.load() == 0)
        return;
    g_log_ofs.flush();
    std::error_code ec;
    auto size = fs::file_size(g_log_path, ec);
    if (!ec && size > g_max_size.load())
        rotate_files();
}

void log_worker() {
    std::vector<std::unique_ptr<LogEntry>> batch;
    batch.reserve(16);
    while (true) {
        std::unique_lock<std::mutex> lk(g_queue_mtx);
        g_queue_cv.wait(lk, [] { return !g_log_queue.empty() || !g_running; });
        if (!g_running && g_log_queue.empty())
            break;
        while (!g_log_queue.empty() && batch.size() < 16) {
            batch.push_back(std::move(g_log_queue.front()));
            g_log_queue.pop();
        }
        g_in_flight = batch.size();
        lk.unlock();
        for (const auto& e : batch)
            write_log_entry(*e);
        batch.clear();
        g_log_ofs.flush();
        lk.lock();
        g_in_flight = 0;
        if (g_log_queue.empty())
            g_drained_cv.notify_all();
    }
    g_log_ofs.flush();
    g_drained_cv.notify_all();
}

} // namespace

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

LogLevel parse_log_level(const std::string& text, bool& ok) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    ok = true;
    if (lower == "debug")
        return LogLevel::DEBUG;
    if (lower == "info")
        return LogLevel::INFO;
    if (lower == "warning" || lower == "warn")
        return LogLevel::WARNING;
    if (lower == "error" || lower == "err")
        return LogLevel::ERR;
    ok = false;
    return LogLevel::INFO;
}

bool init_logger(const LoggerSettings& settings) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    g_ready.store(false);
    stop_log_thread();
    std::string prev_path = g_log_path;
    if (g_log_ofs.is_open())
        g_log_ofs.close();
    g_log_ofs.clear();
    g_max_size.store(settings.max_size);
    g_max_files.store(settings.max_files);
    g_json_log.store(settings.json);
    g_compress_logs.store(settings.compress);
    g_min_level.store(settings.level);

    bool opened = true;
    std::string target = settings.path;
    g_log_ofs.open(target, std::ios::app);
    if (!g_log_ofs.is_open()) {
        std::cerr << "Failed to open log file: " << settings.path << std::endl;
        opened = false;
        target = prev_path;
        g_log_ofs.clear();
        if (!target.empty())
            g_log_ofs.open(target, std::ios::app);
    }
    g_log_path = target;
    g_ready.store(g_log_ofs.is_open());
    {
        std::lock_guard<std::mutex> qlk(g_queue_mtx);
        g_running = true;
    }
    g_log_thread = std::thread(log_worker);
    return opened;
}

void set_log_level(LogLevel level) { g_min_level.store(level); }

LogLevel log_level() { return g_min_level.load(); }

bool logger_initialized() { return g_ready.load(); }

void flush_logger() {
    std::unique_lock<std::mutex> lk(g_queue_mtx);
    if (!g_running)
        return;
    g_drained_cv.wait(lk, [] { return (g_log_queue.empty() && g_in_flight == 0) || !g_running; });
}

void log_event(LogLevel level, const std::string& message, const LogFields& fields) {
    if (level < g_min_level.load())
        return;
    {
        std::lock_guard<std::mutex> lk(g_queue_mtx);
        if (!g_running)
            return;
        g_log_queue.push(std::make_unique<LogEntry>(LogEntry{level, message, fields}));
    }
    g_queue_cv.notify_one();
}

void log_debug(const std::string& msg, const LogFields& fields) {
    log_event(LogLevel::DEBUG, msg, fields);
}
void log_info(const std::string& msg, const LogFields& fields) {
    log_event(LogLevel::INFO, msg, fields);
}
void log_warning(const std::string& msg, const LogFields& fields) {
    log_event(LogLevel::WARNING, msg, fields);
}
void log_error(const std::string& msg, const LogFields& fields) {
    log_event(LogLevel::ERR, msg, fields);
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    g_ready.store(false);
    stop_log_thread();
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_path.clear();
    std::lock_guard<std::mutex> qlk(g_queue_mtx);
    while (!g_log_queue.empty())
        g_log_queue.pop();
}
