#include "log.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <fstream>
#include <mutex>

namespace {

// Never destroyed: the pump thread may still log during static destruction.
std::mutex& log_mutex() {
    static std::mutex* m = new std::mutex;
    return *m;
}

std::string& log_path_ref() {
    static std::string* path = new std::string((platform::temp_dir() / DEBUG_LOG_NAME).string());
    return *path;
}

bool g_log_enabled = true;

} // namespace

std::string linecap_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return log_path_ref();
}

void set_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex());
    log_path_ref() = path;
}

void set_log_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(log_mutex());
    g_log_enabled = enabled;
}

void linecap_log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex());
    if (!g_log_enabled) return;

    std::ofstream out(log_path_ref(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    out << fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}\n",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()), msg);
}
