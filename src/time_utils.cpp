#include "time_utils.hpp"
#include <cstdio>
#include <ctime>

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03d", buf, static_cast<int>(ms.count()));
    return std::string(out);
}

std::string format_elapsed(std::chrono::steady_clock::duration dur) {
    long long ms = std::chrono::duration_cast<std::chrono::milliseconds>(dur).count();
    if (ms < 0)
        ms = 0;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%lld.%03llds", ms / 1000, ms % 1000);
    return std::string(buf);
}
