#include "hookvault/log.hpp"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace hookvault {

namespace {

std::atomic<bool> g_verbose{false};
std::mutex g_log_mutex;

void format_now(char* buf, size_t size) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()).count() % 1000;
    struct tm tm_val;
    gmtime_r(&t, &tm_val);
    size_t n = strftime(buf, size, "%Y-%m-%dT%H:%M:%S", &tm_val);
    snprintf(buf + n, size - n, ".%03dZ", static_cast<int>(ms));
}

void vlog(FILE* out, const char* level, const char* component, const char* fmt, va_list args) {
    char ts[40];
    format_now(ts, sizeof(ts));

    std::lock_guard lock(g_log_mutex);
    if (level) {
        fprintf(out, "%s [%s] %s: ", ts, component, level);
    } else {
        fprintf(out, "%s [%s] ", ts, component);
    }
    vfprintf(out, fmt, args);
    fputc('\n', out);
    fflush(out);
}

}  // namespace

void log_info(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stdout, nullptr, component, fmt, args);
    va_end(args);
}

void log_warn(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stderr, "WARNING", component, fmt, args);
    va_end(args);
}

void log_error(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stderr, "ERROR", component, fmt, args);
    va_end(args);
}

void set_verbose_logging(bool enabled) {
    g_verbose.store(enabled, std::memory_order_relaxed);
}

bool verbose_logging() {
    return g_verbose.load(std::memory_order_relaxed);
}

}  // namespace hookvault
