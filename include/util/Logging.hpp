#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace logging {

struct LogField {
    std::string key;
    std::string value;
};

struct LoggingConfig {
    std::string level;    // trace|debug|info|warn|err|critical|off, empty = info
    std::string pattern;  // spdlog pattern, empty = default
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

// EXTRACTOR_LOG_LEVEL / EXTRACTOR_LOG_PATTERN override the config values.
void init(const LoggingConfig& config);
void shutdown();

void log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void log_debug(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::debug, message, fields);
}

inline void log_info(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::info, message, fields);
}

inline void log_warn(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::warn, message, fields);
}

inline void log_error(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::err, message, fields);
}

} // namespace logging

#define EXTRACTOR_LOG_DEBUG(message, ...) ::logging::log_debug((message), ##__VA_ARGS__)
#define EXTRACTOR_LOG_INFO(message, ...) ::logging::log_info((message), ##__VA_ARGS__)
#define EXTRACTOR_LOG_WARN(message, ...) ::logging::log_warn((message), ##__VA_ARGS__)
#define EXTRACTOR_LOG_ERROR(message, ...) ::logging::log_error((message), ##__VA_ARGS__)
