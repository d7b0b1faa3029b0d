#include "util/logger.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstring>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>

namespace otafetch {

namespace {
std::mutex g_mu;
LogLevel g_level = LogLevel::Info;
thread_local std::string t_thread_tag = "main";
std::atomic<LogPreWriteHook> g_pre_write{nullptr};

const char* ToStr(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "LOG";
    }
}

// "2026-05-01 12:00:00.123"
void FormatTimestamp(char* buf, size_t buf_len) {
    if (buf_len == 0) return;
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    if (localtime_r(&secs, &tm) == nullptr) {
        buf[0] = '\0';
        return;
    }
    const size_t n = std::strftime(buf, buf_len, "%Y-%m-%d %H:%M:%S", &tm);
    if (n > 0 && n < buf_len) {
        std::snprintf(buf + n, buf_len - n, ".%03d", static_cast<int>(ms));
    }
}

const char* BaseName(const char* file) {
    if (!file || *file == '\0') return nullptr;
    const char* slash = std::strrchr(file, '/');
    return slash ? (slash + 1) : file;
}
} // namespace

bool ParseLogLevel(std::string_view s, LogLevel& out) {
    std::string lower(s);
    for (auto& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "debug") out = LogLevel::Debug;
    else if (lower == "info") out = LogLevel::Info;
    else if (lower == "warn" || lower == "warning") out = LogLevel::Warn;
    else if (lower == "error") out = LogLevel::Error;
    else if (lower == "none") out = LogLevel::None;
    else return false;
    return true;
}

void SetThreadTag(std::string tag) { t_thread_tag = std::move(tag); }

void SetLogPreWriteHook(LogPreWriteHook hook) { g_pre_write.store(hook); }

Logger& Logger::Instance() {
    static Logger inst;
    return inst;
}

void Logger::SetLevel(LogLevel lvl) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_level = lvl;
}

LogLevel Logger::Level() const {
    std::lock_guard<std::mutex> lk(g_mu);
    return g_level;
}

void Logger::Log(LogLevel lvl, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, nullptr, 0, fmt, ap);
    va_end(ap);
}

void Logger::VLog(LogLevel lvl, const char* fmt, va_list ap) {
    VLogWithSource(lvl, nullptr, 0, fmt, ap);
}

void Logger::LogWithSource(LogLevel lvl,
                           const char* file,
                           int line,
                           const char* fmt,
                           ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, file, line, fmt, ap);
    va_end(ap);
}

void Logger::VLogWithSource(LogLevel lvl,
                            const char* file,
                            int line,
                            const char* fmt,
                            va_list ap) {
    if (lvl == LogLevel::None || lvl < Level()) return;

    // Build the whole line first so concurrent workers never interleave.
    char ts[40]{};
    FormatTimestamp(ts, sizeof(ts));
    std::string out;
    out.reserve(160);
    if (ts[0] != '\0') {
        out.append("[").append(ts).append("] ");
    }
    out.append("[").append(ToStr(lvl)).append("] [").append(t_thread_tag).append("] ");
    const char* base = BaseName(file);
    if (base && line > 0) {
        out.append("[").append(base).append(":").append(std::to_string(line)).append("] ");
    }

    char msg[1024];
    const int n = std::vsnprintf(msg, sizeof(msg), fmt, ap);
    if (n >= 0) {
        out.append(msg, static_cast<size_t>(n) < sizeof(msg) ? static_cast<size_t>(n) : sizeof(msg) - 1);
    }
    out.push_back('\n');

    std::lock_guard<std::mutex> lk(g_mu);
    if (auto hook = g_pre_write.load()) hook();
    std::fputs(out.c_str(), stderr);
}

} // namespace otafetch
