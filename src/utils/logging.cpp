#include "utils/logging.hpp"

#include <iostream>

#include "utils/common.hpp"

namespace gistools::utils {

LogLevel LogLevelFromString(const std::string& value, LogLevel fallback) {
    const auto lowered = ToLower(Trim(value));
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

Logger& Logger::Current() {
    static Logger logger;
    return logger;
}

void Logger::Configure(const LogConfig& config) {
    config_ = config;
}

void Logger::SetSink(Sink sink) {
    sink_ = std::move(sink);
}

void Logger::Log(LogLevel level, const std::string& tag, const std::string& message) {
    if (static_cast<int>(level) < static_cast<int>(config_.min_level)) {
        return;
    }
    if (sink_) {
        LogMessage entry{level, message, {}};
        entry.fields["tag"] = tag;
        sink_(entry);
        return;
    }
    std::cerr << "[" << ToString(level) << "] [" << tag << "] " << message << std::endl;
}

}  // namespace gistools::utils
