// Minimal logging utility (header-only) for termxfer.
// Enabled by TERMXFER_LOG or by setLogFile(); the watcher thread logs too, so writes are serialized.
#pragma once
#include <cstdio>
#include <cstdlib>
#include <cstdarg>
#include <ctime>
#include <mutex>
#include <string>

namespace termxfer {

struct LogSink {
    std::mutex mtx;
    std::FILE* file = nullptr; // nullptr -> stderr
    bool forced = false;       // enabled without the environment variable
};

inline LogSink& logSink() {
    static LogSink sink;
    return sink;
}

inline bool logEnabled() {
    if (logSink().forced) return true;
    const char* v = std::getenv("TERMXFER_LOG");
    return v && *v && *v != '0';
}

// Send log output to a file and enable logging. Returns false if the file cannot be opened.
inline bool setLogFile(const std::string& path) {
    LogSink& s = logSink();
    std::lock_guard<std::mutex> lk(s.mtx);
    std::FILE* f = std::fopen(path.c_str(), "a");
    if (!f) return false;
    if (s.file) std::fclose(s.file);
    s.file = f;
    s.forced = true;
    return true;
}

inline void closeLogFile() {
    LogSink& s = logSink();
    std::lock_guard<std::mutex> lk(s.mtx);
    if (s.file) std::fclose(s.file);
    s.file = nullptr;
    s.forced = false;
}

inline void logf(const char* level, const char* fmt, ...) {
    if (!logEnabled()) return;
    LogSink& s = logSink();
    std::lock_guard<std::mutex> lk(s.mtx);
    std::FILE* out = s.file ? s.file : stderr;
    char ts[32] = {0};
    std::time_t now = std::time(nullptr);
    std::tm tmv{};
    localtime_r(&now, &tmv);
    std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tmv);
    std::fprintf(out, "%s [termxfer][%s] ", ts, level);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(out, fmt, ap);
    va_end(ap);
    std::fprintf(out, "\n");
    std::fflush(out);
}

} // namespace termxfer

#define LOGD(fmt, ...) \
    do { \
        if (termxfer::logEnabled()) \
            termxfer::logf("DEBUG", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGI(fmt, ...) \
    do { \
        if (termxfer::logEnabled()) \
            termxfer::logf("INFO", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGW(fmt, ...) \
    do { \
        if (termxfer::logEnabled()) \
            termxfer::logf("WARN", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGE(fmt, ...) \
    do { \
        if (termxfer::logEnabled()) \
            termxfer::logf("ERROR", fmt, ##__VA_ARGS__); \
    } while (0)
