#include "ibangen_log.hpp"
#include "utils.hpp"
#include "duckdb/common/printer.hpp"
#include "duckdb/common/error_data.hpp"

#include <atomic>
#include <mutex>

namespace duckdb {
namespace ibangen {

static std::atomic<uint8_t> g_log_level(static_cast<uint8_t>(LogLevel::WARN));
static std::mutex g_sink_lock;
static Log::Sink g_sink;

const char *LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DBG:  return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERR:  return "ERROR";
        case LogLevel::OFF:  return "OFF";
    }
    return "UNKNOWN";
}

LogLevel LogLevelFromString(const std::string &name) {
    std::string level = to_upper(trim(name));
    if (level == "DEBUG") {
        return LogLevel::DBG;
    } else if (level == "INFO") {
        return LogLevel::INFO;
    } else if (level == "WARN" || level == "WARNING") {
        return LogLevel::WARN;
    } else if (level == "ERROR") {
        return LogLevel::ERR;
    } else if (level == "OFF") {
        return LogLevel::OFF;
    }
    throw InvalidInputException("Unknown ibangen log level '%s', expected debug, info, warn, error or off",
                                name.c_str());
}

std::string ErrorMessage(const std::exception &ex) {
    ErrorData error(ex);
    return error.RawMessage();
}

void Log::SetLevel(LogLevel level) {
    g_log_level.store(static_cast<uint8_t>(level));
}

LogLevel Log::GetLevel() {
    return static_cast<LogLevel>(g_log_level.load());
}

bool Log::ShouldLog(LogLevel level) {
    return level != LogLevel::OFF && static_cast<uint8_t>(level) >= g_log_level.load();
}

void Log::SetSink(Sink sink) {
    std::lock_guard<std::mutex> guard(g_sink_lock);
    g_sink = std::move(sink);
}

void Log::ResetSink() {
    std::lock_guard<std::mutex> guard(g_sink_lock);
    g_sink = nullptr;
}

void Log::Debug(const std::string &message) {
    Write(LogLevel::DBG, message);
}

void Log::Info(const std::string &message) {
    Write(LogLevel::INFO, message);
}

void Log::Warning(const std::string &message) {
    Write(LogLevel::WARN, message);
}

void Log::Write(LogLevel level, const std::string &message) {
    if (!ShouldLog(level)) {
        return;
    }
    std::lock_guard<std::mutex> guard(g_sink_lock);
    if (g_sink) {
        g_sink(level, message);
        return;
    }
    Printer::Print(std::string("[ibangen] ") + LogLevelToString(level) + ": " + message);
}

} // namespace ibangen
} // namespace duckdb
