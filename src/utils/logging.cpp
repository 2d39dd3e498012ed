#include "utils/logging.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <map>

#include "utils/common.hpp"

namespace librarian::utils {
namespace {

bool IsSecretKey(const std::string& lowered) {
    static const char* kSecretMarkers[] = {"apikey", "api_key", "token", "secret", "password"};
    for (const auto* marker : kSecretMarkers) {
        if (lowered.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool IsPayloadKey(const std::string& lowered) {
    return lowered == "script" || lowered == "query" || lowered == "content" ||
        lowered == "data" || lowered == "instruction";
}

std::string ShortenHome(const std::string& value) {
    const char* home = std::getenv("HOME");
    if (!home || std::string(home).size() <= 1) {
        return value;
    }
    const std::string prefix(home);
    std::string result;
    std::size_t pos = 0;
    while (true) {
        const auto found = value.find(prefix, pos);
        if (found == std::string::npos) {
            result.append(value, pos, std::string::npos);
            break;
        }
        result.append(value, pos, found - pos);
        result.append("~");
        pos = found + prefix.size();
    }
    return result;
}

}  // namespace

bool ParseLogLevel(const std::string& text, LogLevel& level) {
    const auto lowered = ToLower(Trim(text));
    if (lowered == "debug") {
        level = LogLevel::kDebug;
    } else if (lowered == "info") {
        level = LogLevel::kInfo;
    } else if (lowered == "warn" || lowered == "warning") {
        level = LogLevel::kWarn;
    } else if (lowered == "error") {
        level = LogLevel::kError;
    } else {
        return false;
    }
    return true;
}

LogFields RedactFields(const LogFields& fields) {
    LogFields redacted;
    for (const auto& [key, value] : fields) {
        const auto lowered = ToLower(key);
        if (IsSecretKey(lowered)) {
            redacted[key] = "[REDACTED]";
        } else if (IsPayloadKey(lowered)) {
            redacted[key] = "<" + std::to_string(value.size()) + " chars>";
        } else {
            redacted[key] = ShortenHome(value);
        }
    }
    return redacted;
}

void LogSink::Log(LogLevel level,
                  const std::string& component,
                  const std::string& message,
                  LogFields fields) {
    Write(LogMessage{level, component, message, std::move(fields)});
}

StderrLogSink::StderrLogSink(LogConfig config)
    : config_(config) {}

void StderrLogSink::Write(const LogMessage& message) {
    if (message.level < config_.min_level) {
        return;
    }
    // Sorted so that repeated runs produce identical lines.
    const auto redacted = RedactFields(message.fields);
    const std::map<std::string, std::string> ordered(redacted.begin(), redacted.end());

    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << "[" << message.component << "] " << ToString(message.level)
              << " " << message.message;
    for (const auto& [key, value] : ordered) {
        std::cerr << " " << key << "=" << value;
    }
    std::cerr << std::endl;
}

}  // namespace librarian::utils
