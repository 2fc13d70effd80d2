#pragma once
#include <spdlog/common.h>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

struct LogField {
    std::string key;
    std::string value;
};

LogField string_field(std::string_view key, std::string_view value);
LogField int_field(std::string_view key, std::int64_t value);
LogField bool_field(std::string_view key, bool value);

// True for the names spdlog::level::from_str understands ("warn", "error", ...).
bool is_log_level(const std::string& name);

// Installs the colored stdout logger. UPDATE_SERVER_LOG_LEVEL overrides level
// when it names a valid level.
void init_logging(const std::string& level);
void shutdown_logging();

void log_message(spdlog::level::level_enum level, std::string_view message,
                 std::initializer_list<LogField> fields = {});

inline void log_debug(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log_message(spdlog::level::debug, message, fields);
}

inline void log_info(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log_message(spdlog::level::info, message, fields);
}

inline void log_warn(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log_message(spdlog::level::warn, message, fields);
}

inline void log_error(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log_message(spdlog::level::err, message, fields);
}

#define UPDATE_SERVER_LOG_DEBUG(message, ...) ::log_debug((message), ##__VA_ARGS__)
#define UPDATE_SERVER_LOG_INFO(message, ...) ::log_info((message), ##__VA_ARGS__)
#define UPDATE_SERVER_LOG_WARN(message, ...) ::log_warn((message), ##__VA_ARGS__)
#define UPDATE_SERVER_LOG_ERROR(message, ...) ::log_error((message), ##__VA_ARGS__)
