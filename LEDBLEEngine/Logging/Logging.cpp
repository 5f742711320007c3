// Engine logging backend: categories are static handles, every line is
// formatted once and handed to the installed sink.
#include "Logging.hpp"

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <utility>

namespace {

constexpr size_t kMaxLineLength = 1024;

std::mutex& SinkLock() {
    static std::mutex lock;
    return lock;
}

LEDBLE::Logging::LogSink& InstalledSink() {
    static LEDBLE::Logging::LogSink sink;
    return sink;
}

void WriteToStderr(LEDBLE::Logging::Level level, std::string_view line) {
    std::fprintf(stderr, "%s %.*s\n", LEDBLE::Logging::ToString(level),
                 static_cast<int>(line.size()), line.data());
}

} // namespace

namespace LEDBLE::Logging {

const LogCategory& Engine()        { static const LogCategory c{"engine"};        return c; }
const LogCategory& Advertisement() { static const LogCategory c{"advertisement"}; return c; }
const LogCategory& Capabilities()  { static const LogCategory c{"capabilities"};  return c; }
const LogCategory& Commands()      { static const LogCategory c{"commands"};      return c; }
const LogCategory& Transport()     { static const LogCategory c{"transport"};     return c; }
const LogCategory& Session()       { static const LogCategory c{"session"};       return c; }
const LogCategory& State()         { static const LogCategory c{"state"};         return c; }
const LogCategory& Probe()         { static const LogCategory c{"probe"};         return c; }

void SetSink(LogSink sink) {
    std::lock_guard guard(SinkLock());
    InstalledSink() = std::move(sink);
}

void Emit(const LogCategory& category, Level level, const char* fmt, ...) {
    char buffer[kMaxLineLength];
    va_list args;
    va_start(args, fmt);
    const int written = std::vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);
    if (written < 0) {
        return;
    }
    const size_t length = std::min(static_cast<size_t>(written), sizeof(buffer) - 1);
    const std::string_view line(buffer, length);

    std::lock_guard guard(SinkLock());
    if (const auto& sink = InstalledSink()) {
        sink(level, category, line);
    } else {
        WriteToStderr(level, line);
    }
}

const char* ToString(Level level) noexcept {
    switch (level) {
        case Level::Default: return "DEFAULT";
        case Level::Info:    return "INFO";
        case Level::Debug:   return "DEBUG";
        case Level::Error:   return "ERROR";
        case Level::Fault:   return "FAULT";
    }
    return "UNKNOWN";
}

} // namespace LEDBLE::Logging
