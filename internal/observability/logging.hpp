#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace rulebook::runtime::config {
class RuntimeConfig;
}

namespace rulebook::observability {

/*
  Structured logging over one spdlog logger. Fields are rendered as
  key=value after the message; values containing spaces are quoted.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

void InitializeLogging(const rulebook::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace rulebook::observability

#define RULEBOOK_LOG_DEBUG(message, ...) ::rulebook::observability::Log(::spdlog::level::debug, (message), ##__VA_ARGS__)
#define RULEBOOK_LOG_INFO(message, ...) ::rulebook::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define RULEBOOK_LOG_WARN(message, ...) ::rulebook::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define RULEBOOK_LOG_ERROR(message, ...) ::rulebook::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
