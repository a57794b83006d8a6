#include "logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace obs {
namespace {

    const char* LOGGER_NAME = "relmap";

    std::string resolve_level(const std::string& level) {
        if (const char* env = std::getenv("RELMAP_LOG_LEVEL")) {
            return env;
        }
        if (!level.empty()) {
            return level;
        }
        return "info";
    }

    std::string resolve_pattern(const std::string& pattern) {
        if (const char* env = std::getenv("RELMAP_LOG_PATTERN")) {
            return env;
        }
        if (!pattern.empty()) {
            return pattern;
        }
        return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
    }

    std::string serialize_fields(std::initializer_list<LogField> fields) {
        std::ostringstream out;
        bool first = true;
        for (const auto& field : fields) {
            if (!first) {
                out << ' ';
            }
            first = false;
            out << field.key << '=' << field.value;
        }
        return out.str();
    }

} // namespace

LogField str_field(std::string_view key, std::string_view value) {
    return { std::string(key), std::string(value) };
}

LogField int_field(std::string_view key, std::int64_t value) {
    return { std::string(key), std::to_string(value) };
}

LogField bool_field(std::string_view key, bool value) {
    return { std::string(key), value ? "true" : "false" };
}

void init_logging(const std::string& level, const std::string& pattern) {
    // stderr keeps command output on stdout clean
    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = spdlog::stderr_color_mt(LOGGER_NAME);
    }
    logger->set_pattern(resolve_pattern(pattern));
    logger->set_level(spdlog::level::from_str(resolve_level(level)));
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::warn);
}

void shutdown_logging() {
    spdlog::shutdown();
}

void log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
    auto serialized = serialize_fields(fields);
    if (!serialized.empty()) {
        spdlog::log(level, "{} {}", message, serialized);
        return;
    }
    spdlog::log(level, "{}", message);
}

} // namespace obs
