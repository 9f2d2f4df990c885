#include "util/logger.hpp"

#include <cstring>
#include <ctime>
#include <mutex>
#include <string>

namespace peel {

namespace {

struct LoggerState {
    std::mutex mu;
    LogLevel level = LogLevel::Warn;
    std::FILE* stream = nullptr;
};

LoggerState& State() {
    static LoggerState state;
    return state;
}

const char* LevelLabel(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::None:  break;
    }
    return "log";
}

std::string DebugPrefix(const char* file, int line) {
    char ts[32]{};
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    if (localtime_r(&now, &tm)) {
        std::strftime(ts, sizeof(ts), "%H:%M:%S", &tm);
    }
    std::string prefix = "[" + std::string(ts) + "]";
    if (file && *file && line > 0) {
        const char* slash = std::strrchr(file, '/');
        prefix += " [" + std::string(slash ? slash + 1 : file) + ":" + std::to_string(line) + "]";
    }
    return prefix + " ";
}

} // namespace

LogLevel LogLevelForVerbosity(int verbosity) {
    if (verbosity >= 2) return LogLevel::Debug;
    switch (verbosity) {
        case 1:  return LogLevel::Info;
        case 0:  return LogLevel::Warn;
        case -1: return LogLevel::Error;
        default: return LogLevel::None;
    }
}

Logger& Logger::Instance() {
    static Logger inst;
    return inst;
}

void Logger::SetLevel(LogLevel lvl) {
    auto& st = State();
    std::lock_guard<std::mutex> lk(st.mu);
    st.level = lvl;
}

LogLevel Logger::Level() const {
    auto& st = State();
    std::lock_guard<std::mutex> lk(st.mu);
    return st.level;
}

void Logger::SetStream(std::FILE* stream) {
    auto& st = State();
    std::lock_guard<std::mutex> lk(st.mu);
    st.stream = stream;
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
    auto& st = State();
    std::lock_guard<std::mutex> lk(st.mu);
    if (lvl < st.level || lvl == LogLevel::None) return;

    std::FILE* out = st.stream ? st.stream : stderr;
    if (st.level == LogLevel::Debug) {
        std::fputs(DebugPrefix(file, line).c_str(), out);
    }
    std::fprintf(out, "peel: %s: ", LevelLabel(lvl));
    std::vfprintf(out, fmt, ap);
    std::fputc('\n', out);
    std::fflush(out);
}

} // namespace peel
