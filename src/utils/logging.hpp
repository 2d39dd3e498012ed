#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

namespace librarian::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

// Accepts "debug", "info", "warn"/"warning", "error" in any case.
bool ParseLogLevel(const std::string& text, LogLevel& level);

using LogFields = std::unordered_map<std::string, std::string>;

struct LogMessage {
    LogLevel level;
    std::string component;
    std::string message;
    LogFields fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

// Masks credentials, replaces payload-bearing fields by their length and
// shortens the home directory to "~".
LogFields RedactFields(const LogFields& fields);

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void Write(const LogMessage& message) = 0;

    void Log(LogLevel level,
             const std::string& component,
             const std::string& message,
             LogFields fields = {});
};

class StderrLogSink : public LogSink {
public:
    explicit StderrLogSink(LogConfig config = {});
    void Write(const LogMessage& message) override;

private:
    LogConfig config_;
    std::mutex mutex_;
};

class NullLogSink : public LogSink {
public:
    void Write(const LogMessage&) override {}
};

}  // namespace librarian::utils
