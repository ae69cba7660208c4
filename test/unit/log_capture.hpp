#pragma once

#include "ibangen_log.hpp"
#include <string>
#include <utility>
#include <vector>

namespace duckdb {
namespace ibangen {

// Collects log records for the lifetime of the object
class LogCapture {
public:
    explicit LogCapture(LogLevel level = LogLevel::DBG) : previous_level(Log::GetLevel()) {
        Log::SetLevel(level);
        Log::SetSink([this](LogLevel record_level, const std::string &message) {
            records.emplace_back(record_level, message);
        });
    }
    ~LogCapture() {
        Log::ResetSink();
        Log::SetLevel(previous_level);
    }

    size_t Count(LogLevel level) const {
        size_t count = 0;
        for (auto &record : records) {
            if (record.first == level) {
                count++;
            }
        }
        return count;
    }

    bool Contains(LogLevel level, const std::string &fragment) const {
        for (auto &record : records) {
            if (record.first == level && record.second.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    std::vector<std::pair<LogLevel, std::string>> records;

private:
    LogLevel previous_level;
};

} // namespace ibangen
} // namespace duckdb
