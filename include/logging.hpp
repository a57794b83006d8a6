#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace obs {

struct LogField {
    std::string key;
    std::string value;
};

LogField str_field(std::string_view key, std::string_view value);
LogField int_field(std::string_view key, std::int64_t value);
LogField bool_field(std::string_view key, bool value);

// RELMAP_LOG_LEVEL / RELMAP_LOG_PATTERN take precedence over the arguments.
void init_logging(const std::string& level = "", const std::string& pattern = "");
void shutdown_logging();

// Calls shutdown_logging() when it leaves scope, so the sinks are flushed on every exit path.
class LoggingScope {
public:
    LoggingScope() = default;
    ~LoggingScope() { shutdown_logging(); }

    LoggingScope(const LoggingScope&) = delete;
    LoggingScope& operator=(const LoggingScope&) = delete;
};

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

} // namespace obs

#define RELMAP_LOG_DEBUG(message, ...) ::obs::log_debug((message), ##__VA_ARGS__)
#define RELMAP_LOG_INFO(message, ...) ::obs::log_info((message), ##__VA_ARGS__)
#define RELMAP_LOG_WARN(message, ...) ::obs::log_warn((message), ##__VA_ARGS__)
#define RELMAP_LOG_ERROR(message, ...) ::obs::log_error((message), ##__VA_ARGS__)
