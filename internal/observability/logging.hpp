#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <exception>
#include <initializer_list>
#include <string>
#include <string_view>

namespace settle::runtime::config {
class RuntimeConfig;
}

namespace settle::observability {

// key=value pair appended to a log line. Values containing whitespace or
// quotes are written quoted.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

// item=<transaction id>
LogField ItemField(std::string_view item_id);
// error=<what()>
LogField ErrorField(const std::exception& error);

std::string FormatFields(std::initializer_list<LogField> fields);

// Installs the "swap-settlement" logger as spdlog's default. SETTLE_LOG_LEVEL
// and SETTLE_LOG_PATTERN override the logging section of the config.
void InitializeLogging(const settle::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace settle::observability

#define SETTLE_LOG_INFO(message, ...) ::settle::observability::Log(spdlog::level::info, (message), ##__VA_ARGS__)
#define SETTLE_LOG_WARN(message, ...) ::settle::observability::Log(spdlog::level::warn, (message), ##__VA_ARGS__)
#define SETTLE_LOG_ERROR(message, ...) ::settle::observability::Log(spdlog::level::err, (message), ##__VA_ARGS__)
