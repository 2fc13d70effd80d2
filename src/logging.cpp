#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <sstream>

namespace {

const char* kPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::string resolve_level(const std::string& configured) {
    const char* level = std::getenv("UPDATE_SERVER_LOG_LEVEL");
    if (level && is_log_level(level))
        return level;
    if (!configured.empty())
        return configured;
    return "info";
}

std::string serialize_fields(std::initializer_list<LogField> fields) {
    std::ostringstream out;
    bool first = true;
    for (const auto& field : fields) {
        if (!first)
            out << ' ';
        first = false;
        out << field.key << '=' << field.value;
    }
    return out.str();
}

} // namespace

bool is_log_level(const std::string& name) {
    return name == "off" || spdlog::level::from_str(name) != spdlog::level::off;
}

LogField string_field(std::string_view key, std::string_view value) {
    return {std::string(key), std::string(value)};
}

LogField int_field(std::string_view key, std::int64_t value) {
    return {std::string(key), std::to_string(value)};
}

LogField bool_field(std::string_view key, bool value) {
    return {std::string(key), value ? "true" : "false"};
}

void init_logging(const std::string& level) {
    auto logger = spdlog::get("update_server");
    if (!logger)
        logger = spdlog::stdout_color_mt("update_server");
    logger->set_pattern(kPattern);
    logger->set_level(spdlog::level::from_str(resolve_level(level)));
    spdlog::set_default_logger(std::move(logger));
    spdlog::flush_on(spdlog::level::warn);
}

void shutdown_logging() {
    spdlog::shutdown();
}

void log_message(spdlog::level::level_enum level, std::string_view message,
                 std::initializer_list<LogField> fields) {
    auto serialized = serialize_fields(fields);
    if (serialized.empty()) {
        spdlog::log(level, "{}", message);
        return;
    }
    spdlog::log(level, "{} {}", message, serialized);
}
