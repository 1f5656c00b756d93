// Bounded in-memory log shown in the log panel. Newest record first; the oldest is evicted.
#pragma once
#include <chrono>
#include <cstddef>
#include <deque>
#include <string>

namespace termxfer {

enum class LogLevel { Error, Warn, Info };

struct LogRecord {
    std::chrono::system_clock::time_point time;
    LogLevel level = LogLevel::Info;
    std::string message;
};

const char* logLevelName(LogLevel level);

class LogRing {
public:
    static constexpr std::size_t kDefaultCapacity = 256;

    explicit LogRing(std::size_t capacity = kDefaultCapacity) : capacity_(capacity ? capacity : 1) {}

    // Append a record; also forwarded to the process log sink.
    void push(LogLevel level, const std::string& message);

    const std::deque<LogRecord>& records() const { return records_; }
    std::size_t size() const { return records_.size(); }
    std::size_t capacity() const { return capacity_; }
    bool empty() const { return records_.empty(); }
    void clear() { records_.clear(); }

private:
    std::size_t capacity_;
    std::deque<LogRecord> records_; // front = newest
};

} // namespace termxfer
