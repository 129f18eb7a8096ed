#include "util/logger.hpp"

#include <cctype>
#include <cstring>
#include <ctime>
#include <mutex>

namespace filepipe {

namespace {
std::mutex g_mu;
LogLevel g_level = LogLevel::Info;
std::FILE* g_stream = nullptr;

const char* ToStr(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "LOG";
    }
}

void FormatTimestamp(char* buf, size_t buf_len) {
    if (buf_len == 0) return;
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    if (localtime_r(&now, &tm) == nullptr) {
        buf[0] = '\0';
        return;
    }
    std::strftime(buf, buf_len, "%Y-%m-%d %H:%M:%S", &tm);
}

const char* BaseName(const char* file) {
    if (!file || *file == '\0') return nullptr;
    const char* slash = std::strrchr(file, '/');
    return slash ? (slash + 1) : file;
}
} // namespace

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

void Logger::SetStream(std::FILE* stream) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_stream = stream;
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
    std::lock_guard<std::mutex> lk(g_mu);
    if (lvl < g_level || lvl == LogLevel::None) return;

    std::FILE* out = g_stream ? g_stream : stderr;
    char ts[32]{};
    FormatTimestamp(ts, sizeof(ts));
    if (ts[0] != '\0') {
        std::fprintf(out, "[%s] [%s] ", ts, ToStr(lvl));
    } else {
        std::fprintf(out, "[%s] ", ToStr(lvl));
    }
    const char* base = BaseName(file);
    if (base && line > 0) {
        std::fprintf(out, "[%s:%d] ", base, line);
    }
    std::vfprintf(out, fmt, ap);
    std::fprintf(out, "\n");
}

bool ParseLogLevel(const std::string& s, LogLevel& out) {
    std::string l;
    for (char c : s) l.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (l == "debug") out = LogLevel::Debug;
    else if (l == "info") out = LogLevel::Info;
    else if (l == "warn" || l == "warning") out = LogLevel::Warn;
    else if (l == "error") out = LogLevel::Error;
    else if (l == "none" || l == "off") out = LogLevel::None;
    else return false;
    return true;
}

} // namespace filepipe
