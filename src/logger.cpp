#include "logger.hpp"
#include <zlib.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <queue>
#include <thread>
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
// Set while a log file is open; read by producers without taking g_init_mtx.
std::atomic<bool> g_active{false};

std::queue<LogMessage> g_log_queue;
std::mutex g_queue_mtx;
std::condition_variable g_queue_cv;
std::condition_variable g_drained_cv;
bool g_writing = false;
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

std::string format_line(const LogMessage& m) {
    std::string ts = timestamp();
    std::string line;
    if (g_json_log.load()) {
        nlohmann::ordered_json j;
        j["timestamp"] = ts;
        j["level"] = level_label(m.level);
        j["msg"] = m.msg;
        for (const auto& [k, v] : m.fields)
            j[k] = v;
        // Paths are raw bytes; invalid UTF-8 is replaced instead of throwing.
        line = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } else {
        line = "[" + ts + "] [" + level_label(m.level) + "] " + m.msg;
        for (const auto& [k, v] : m.fields)
            line += " " + k + "=" + v;
    }
    return line;
}

bool gzip_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    bool ok = true;
    while (in && ok) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0 && gzwrite(out, buf, static_cast<unsigned int>(n)) == 0)
            ok = false;
    }
    return gzclose(out) == Z_OK && ok;
}

// Shift log.N -> log.N+1, dropping the oldest, then move the active file to log.1.
void rotate_files() {
    std::error_code ec;
    const size_t keep = g_max_files.load();
    const std::string suffix = g_compress_logs.load() ? ".gz" : "";
    g_log_ofs.close();
    if (keep > 0) {
        fs::remove(g_log_path + "." + std::to_string(keep) + suffix, ec);
        for (size_t i = keep; i > 1; --i) {
            fs::rename(g_log_path + "." + std::to_string(i - 1) + suffix,
                       g_log_path + "." + std::to_string(i) + suffix, ec);
        }
        fs::path first = g_log_path + ".1";
        fs::rename(g_log_path, first, ec);
        if (!suffix.empty() && gzip_file(first.string(), first.string() + suffix))
            fs::remove(first, ec);
    }
    g_log_ofs.open(g_log_path, std::ios::trunc);
}

void write_entry(const LogMessage& m) {
    if (!g_log_ofs.is_open() || m.level < g_min_level.load())
        return;
    g_log_ofs << format_line(m) << '\n';
    if (g_max_size.load() == 0)
        return;
    g_log_ofs.flush();
    std::error_code ec;
    auto size = fs::file_size(g_log_path, ec);
    if (!ec && size > g_max_size.load())
        rotate_files();
}

void log_worker() {
    std::unique_lock<std::mutex> lk(g_queue_mtx);
    for (;;) {
        g_queue_cv.wait(lk, [] { return !g_running || !g_log_queue.empty(); });
        while (!g_log_queue.empty()) {
            LogMessage m = std::move(g_log_queue.front());
            g_log_queue.pop();
            g_writing = true;
            lk.unlock();
            write_entry(m);
            lk.lock();
            g_writing = false;
        }
        g_log_ofs.flush();
        g_drained_cv.notify_all();
        if (!g_running)
            break;
    }
}

void stop_log_thread() {
    {
        std::lock_guard<std::mutex> lk(g_queue_mtx);
        g_running = false;
    }
    g_queue_cv.notify_all();
    if (g_log_thread.joinable())
        g_log_thread.join();
}

void enqueue(LogLevel level, const std::string& msg, std::map<std::string, std::string> fields) {
    if (level < g_min_level.load())
        return;
    {
        std::lock_guard<std::mutex> lk(g_queue_mtx);
        if (!g_running)
            return;
        g_log_queue.push(LogMessage{level, msg, std::move(fields)});
    }
    g_queue_cv.notify_one();
}

} // namespace

bool init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    g_active.store(false);
    stop_log_thread();
    if (g_log_ofs.is_open())
        g_log_ofs.close();
    g_log_ofs.clear();
    g_max_size.store(max_size);
    g_max_files.store(max_files);
    g_min_level.store(level);
    g_log_ofs.open(path, std::ios::app);
    if (!g_log_ofs.is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        g_log_path.clear();
        return false;
    }
    g_log_path = path;
    {
        std::lock_guard<std::mutex> qlk(g_queue_mtx);
        g_running = true;
    }
    g_log_thread = std::thread(log_worker);
    g_active.store(true);
    return true;
}

bool parse_log_level(const std::string& name, LogLevel& level) {
    std::string val = name;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (val == "DEBUG")
        level = LogLevel::DEBUG;
    else if (val == "INFO")
        level = LogLevel::INFO;
    else if (val == "WARNING" || val == "WARN")
        level = LogLevel::WARNING;
    else if (val == "ERROR")
        level = LogLevel::ERR;
    else
        return false;
    return true;
}

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

bool logger_initialized() { return g_active.load(); }

void flush_logger() {
    std::unique_lock<std::mutex> lk(g_queue_mtx);
    if (!g_running)
        return;
    g_queue_cv.notify_one();
    g_drained_cv.wait(lk, [] { return g_log_queue.empty() && !g_writing; });
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    g_active.store(false);
    stop_log_thread();
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_path.clear();
}

static void log_with_data(LogLevel level, const std::string& msg, const std::string& data) {
    if (data.empty())
        enqueue(level, msg, {});
    else
        enqueue(level, msg, {{"data", data}});
}

void log_debug(const std::string& msg) { enqueue(LogLevel::DEBUG, msg, {}); }
void log_debug(const std::string& msg, const std::string& data) {
    log_with_data(LogLevel::DEBUG, msg, data);
}
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue(LogLevel::DEBUG, msg, fields);
}

void log_info(const std::string& msg) { enqueue(LogLevel::INFO, msg, {}); }
void log_info(const std::string& msg, const std::string& data) {
    log_with_data(LogLevel::INFO, msg, data);
}
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue(LogLevel::INFO, msg, fields);
}

void log_warning(const std::string& msg) { enqueue(LogLevel::WARNING, msg, {}); }
void log_warning(const std::string& msg, const std::string& data) {
    log_with_data(LogLevel::WARNING, msg, data);
}
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue(LogLevel::WARNING, msg, fields);
}

void log_error(const std::string& msg) { enqueue(LogLevel::ERR, msg, {}); }
void log_error(const std::string& msg, const std::string& data) {
    log_with_data(LogLevel::ERR, msg, data);
}
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue(LogLevel::ERR, msg, fields);
}
