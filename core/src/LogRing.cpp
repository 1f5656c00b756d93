#include "termxfer/LogRing.hpp"
#include "termxfer/Log.hpp"

namespace termxfer {

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Info: return "INFO";
    }
    return "INFO";
}

void LogRing::push(LogLevel level, const std::string& message) {
    switch (level) {
        case LogLevel::Error: LOGE("%s", message.c_str()); break;
        case LogLevel::Warn: LOGW("%s", message.c_str()); break;
        case LogLevel::Info: LOGI("%s", message.c_str()); break;
    }
    records_.push_front(LogRecord{std::chrono::system_clock::now(), level, message});
    while (records_.size() > capacity_) records_.pop_back();
}

} // namespace termxfer
