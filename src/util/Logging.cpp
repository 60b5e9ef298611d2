#include "util/Logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace logging {

static std::string resolve_level(const LoggingConfig& config) {
    if (const char* level = std::getenv("EXTRACTOR_LOG_LEVEL")) return level;
    if (!config.level.empty()) return config.level;
    return "info";
}

static std::string resolve_pattern(const LoggingConfig& config) {
    if (const char* pattern = std::getenv("EXTRACTOR_LOG_PATTERN")) return pattern;
    if (!config.pattern.empty()) return config.pattern;
    return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

static std::string serialize_fields(std::initializer_list<LogField> fields) {
    std::ostringstream out;
    bool first = true;
    for (const auto& field : fields) {
        if (!first) out << ' ';
        first = false;
        out << field.key << '=' << field.value;
    }
    return out.str();
}

LogField StringField(std::string_view key, std::string_view value) {
    return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
    return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
    return {std::string(key), value ? "true" : "false"};
}

LogField DoubleField(std::string_view key, double value) {
    std::ostringstream oss;
    oss << value;
    return {std::string(key), oss.str()};
}

void init(const LoggingConfig& config) {
    // stdout belongs to the CLI's own output
    auto logger = spdlog::get("entity-extractor");
    if (!logger) logger = spdlog::stderr_color_mt("entity-extractor");
    logger->set_pattern(resolve_pattern(config));
    logger->set_level(spdlog::level::from_str(resolve_level(config)));
    spdlog::set_default_logger(std::move(logger));
    spdlog::flush_on(spdlog::level::warn);
}

void shutdown() {
    spdlog::shutdown();
}

void log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
    auto serialized = serialize_fields(fields);
    if (serialized.empty()) {
        spdlog::log(level, "{}", message);
        return;
    }
    spdlog::log(level, "{} {}", message, serialized);
}

} // namespace logging
