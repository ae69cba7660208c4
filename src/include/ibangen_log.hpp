#pragma once

#include "duckdb.hpp"
#include <cstdint>
#include <exception>
#include <functional>
#include <string>

namespace duckdb {
namespace ibangen {

// Avoid DEBUG/ERROR names, both are common macros
enum class LogLevel : uint8_t {
    DBG = 0,
    INFO = 1,
    WARN = 2,
    ERR = 3,
    OFF = 4
};

const char *LogLevelToString(LogLevel level);

// Accepts debug, info, warn/warning, error and off (case insensitive)
LogLevel LogLevelFromString(const std::string &name);

// Message of a DuckDB exception without its JSON envelope
std::string ErrorMessage(const std::exception &ex);

// Process-wide diagnostics for the generators. Messages go to DuckDB's Printer
// unless a sink is installed.
class Log {
public:
    using Sink = std::function<void(LogLevel, const std::string &)>;

    static void SetLevel(LogLevel level);
    static LogLevel GetLevel();
    static bool ShouldLog(LogLevel level);

    static void SetSink(Sink sink);
    static void ResetSink();

    static void Debug(const std::string &message);
    static void Info(const std::string &message);
    static void Warning(const std::string &message);

private:
    static void Write(LogLevel level, const std::string &message);
};

} // namespace ibangen
} // namespace duckdb
