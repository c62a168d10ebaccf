#pragma once

#include <functional>
#include <string>
#include <unordered_map>

namespace gistools::utils {

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

LogLevel LogLevelFromString(const std::string& value, LogLevel fallback);

struct LogMessage {
    LogLevel level;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

// Process-wide logger. Messages carry a short tag ("tool", "output", ...) stored in
// fields["tag"]. The default sink writes "[LEVEL] [tag] message" to stderr.
class Logger {
public:
    using Sink = std::function<void(const LogMessage&)>;

    static Logger& Current();

    void Configure(const LogConfig& config);
    const LogConfig& Config() const { return config_; }

    // Replaces the sink; an empty sink restores the stderr writer.
    void SetSink(Sink sink);

    void Log(LogLevel level, const std::string& tag, const std::string& message);
    void Debug(const std::string& tag, const std::string& message) { Log(LogLevel::kDebug, tag, message); }
    void Info(const std::string& tag, const std::string& message) { Log(LogLevel::kInfo, tag, message); }
    void Warn(const std::string& tag, const std::string& message) { Log(LogLevel::kWarn, tag, message); }
    void Error(const std::string& tag, const std::string& message) { Log(LogLevel::kError, tag, message); }

private:
    Logger() = default;

    LogConfig config_;
    Sink sink_;
};

}  // namespace gistools::utils
