#include <zlib.h>
#include <atomic>
#include <nlohmann/json.hpp>
#include "test_common.hpp"

struct LoggerGuard {
    ~LoggerGuard() { shutdown_logger(); }
};

static std::vector<std::string> read_lines(const fs::path& path) {
    std::ifstream ifs(path);
    REQUIRE(ifs.good());
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line))
        lines.push_back(line);
    return lines;
}

TEST_CASE("Logger rotates and limits files") {
    fs::path log = fs::temp_directory_path() / "dirty_logger_rotate.log";
    fs::path log1 = log;
    log1 += ".1";
    fs::path log2 = log;
    log2 += ".2";
    fs::path log3 = log;
    log3 += ".3";
    fs::remove(log);
    fs::remove(log1);
    fs::remove(log2);
    fs::remove(log3);

    REQUIRE(init_logger(log.string(), LogLevel::INFO, 100, 2));
    LoggerGuard guard;
    REQUIRE(logger_initialized());
    for (int i = 0; i < 200; ++i)
        log_info("entry " + std::to_string(i));
    flush_logger();
    shutdown_logger();
    REQUIRE(fs::exists(log));
    REQUIRE(fs::exists(log1));
    REQUIRE(fs::exists(log2));
    REQUIRE_FALSE(fs::exists(log3));

    fs::remove(log);
    fs::remove(log1);
    fs::remove(log2);
}

TEST_CASE("Logger compresses rotated files") {
    fs::path log = fs::temp_directory_path() / "dirty_logger_compress.log";
    fs::path log1 = log;
    log1 += ".1.gz";
    fs::path log2 = log;
    log2 += ".2.gz";
    fs::remove(log);
    fs::remove(log1);
    fs::remove(log2);

    set_log_compression(true);
    REQUIRE(init_logger(log.string(), LogLevel::INFO, 100, 2));
    LoggerGuard guard;
    for (int i = 0; i < 200; ++i)
        log_info("entry " + std::to_string(i));
    shutdown_logger();

    REQUIRE(fs::exists(log));
    REQUIRE(fs::exists(log1));
    REQUIRE(fs::exists(log2));

    gzFile zf = gzopen(log1.c_str(), "rb");
    REQUIRE(zf != nullptr);
    char buf[32];
    int n = gzread(zf, buf, sizeof(buf));
    gzclose(zf);
    REQUIRE(n > 0);

    fs::remove(log);
    fs::remove(log1);
    fs::remove(log2);
    set_log_compression(false);
}

TEST_CASE("Logger switches between JSON and plain") {
    fs::path log = fs::temp_directory_path() / "dirty_logger_format.log";
    fs::remove(log);
    REQUIRE(init_logger(log.string()));
    LoggerGuard guard;
    set_json_logging(true);
    log_info("json entry", {{"repo", "a"}, {"dirty", "true"}});
    flush_logger();
    set_json_logging(false);
    log_info("plain entry", {{"repo", "b"}, {"dirty", "false"}});
    flush_logger();
    shutdown_logger();

    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].front() == '{');
    REQUIRE(lines[0].find("\"msg\":\"json entry\"") != std::string::npos);
    REQUIRE(lines[0].find("\"repo\":\"a\"") != std::string::npos);
    REQUIRE(lines[1].front() == '[');
    REQUIRE(lines[1].find("[INFO] plain entry") != std::string::npos);
    REQUIRE(lines[1].find("repo=b") != std::string::npos);

    fs::remove(log);
}

TEST_CASE("Logger filters by level") {
    fs::path log = fs::temp_directory_path() / "dirty_logger_level.log";
    fs::remove(log);
    REQUIRE(init_logger(log.string(), LogLevel::WARNING));
    LoggerGuard guard;
    log_debug("hidden debug");
    log_info("hidden info");
    log_warning("shown warning");
    log_error("shown error", "details");
    shutdown_logger();

    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].find("[WARNING] shown warning") != std::string::npos);
    REQUIRE(lines[1].find("[ERROR] shown error data=details") != std::string::npos);
    fs::remove(log);
}

TEST_CASE("parse_log_level accepts known names") {
    LogLevel level = LogLevel::INFO;
    REQUIRE(parse_log_level("debug", level));
    REQUIRE(level == LogLevel::DEBUG);
    REQUIRE(parse_log_level("WARN", level));
    REQUIRE(level == LogLevel::WARNING);
    REQUIRE(parse_log_level("Error", level));
    REQUIRE(level == LogLevel::ERR);
    REQUIRE_FALSE(parse_log_level("loud", level));
    REQUIRE(level == LogLevel::ERR);
}

TEST_CASE("Messages are dropped while the logger is stopped") {
    REQUIRE_FALSE(logger_initialized());
    log_info("nobody is listening");
    flush_logger();
    REQUIRE_FALSE(logger_initialized());
}

TEST_CASE("init_logger fails for an unwritable path") {
    fs::path dir = dirty::test_support::fresh_dir("logger_missing");
    fs::path log = dir / "missing" / "sub" / "out.log";
    REQUIRE_FALSE(init_logger(log.string()));
    REQUIRE_FALSE(logger_initialized());
    FS_REMOVE_ALL(dir);
}

TEST_CASE("shutdown_logger drains queued messages") {
    fs::path log = fs::temp_directory_path() / "dirty_logger_drain.log";
    fs::remove(log);
    REQUIRE(init_logger(log.string()));
    for (int i = 0; i < 50; ++i)
        log_info("queued " + std::to_string(i));
    shutdown_logger();
    REQUIRE(read_lines(log).size() == 50);
    fs::remove(log);
}

TEST_CASE("Concurrent producers all reach the log") {
    fs::path log = fs::temp_directory_path() / "dirty_logger_threads.log";
    fs::remove(log);
    REQUIRE(init_logger(log.string()));
    LoggerGuard guard;
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([t] {
            for (int i = 0; i < 25; ++i)
                log_info("worker " + std::to_string(t) + " entry " + std::to_string(i));
        });
    }
    for (auto& th : producers)
        th.join();
    shutdown_logger();
    REQUIRE(read_lines(log).size() == 100);
    fs::remove(log);
}

TEST_CASE("JSON log lines escape control characters") {
    fs::path log = fs::temp_directory_path() / "dirty_logger_ctrl.log";
    fs::remove(log);
    REQUIRE(init_logger(log.string(), LogLevel::DEBUG));
    LoggerGuard guard;
    set_json_logging(true);
    std::string odd_path = std::string("/src/we") + '\x01' + "ird\x1f" + "\"q\"";
    log_debug("Classified repository", {{"path", odd_path}, {"dirty", "true"}});
    log_debug(std::string("bad utf8 \xff\xfe"), {{"path", "/src/\xc3"}, {"dirty", "false"}});
    shutdown_logger();
    set_json_logging(false);

    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    for (const auto& line : lines) {
        for (unsigned char c : line)
            REQUIRE(c >= 0x20);
    }
    auto first = nlohmann::json::parse(lines[0]);
    REQUIRE(first["path"].get<std::string>() == odd_path);
    REQUIRE(first["level"].get<std::string>() == "DEBUG");
    REQUIRE(first["msg"].get<std::string>() == "Classified repository");
    REQUIRE_NOTHROW(nlohmann::json::parse(lines[1]));
    fs::remove(log);
}

TEST_CASE("logger_initialized is safe to poll during rotation") {
    fs::path log = fs::temp_directory_path() / "dirty_logger_poll.log";
    fs::path log1 = log;
    log1 += ".1";
    fs::remove(log);
    fs::remove(log1);
    REQUIRE(init_logger(log.string(), LogLevel::DEBUG, 64, 1));
    LoggerGuard guard;
    std::atomic<bool> stop{false};
    std::atomic<int> seen_active{0};
    std::vector<std::thread> pollers;
    for (int t = 0; t < 3; ++t) {
        pollers.emplace_back([&] {
            do {
                if (logger_initialized())
                    seen_active.fetch_add(1);
            } while (!stop.load());
        });
    }
    for (int i = 0; i < 300; ++i)
        log_debug("rotating entry " + std::to_string(i));
    flush_logger();
    stop.store(true);
    for (auto& th : pollers)
        th.join();
    REQUIRE(seen_active.load() > 0);
    REQUIRE(logger_initialized());
    shutdown_logger();
    REQUIRE_FALSE(logger_initialized());
    REQUIRE(fs::exists(log1));
    fs::remove(log);
    fs::remove(log1);
}
