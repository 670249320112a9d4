#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace registry::runtime::config {
class RuntimeConfig;
}

namespace registry::observability {

/*
  Structured log line: "<message> key=value key=value".

  Everything goes through the "asset-registry" spdlog logger on stderr so
  registryctl output on stdout stays machine readable.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Asset ids and counters are unsigned 64-bit; printed without a cast.
LogField IdField(std::string_view key, std::uint64_t value);

// Level and pattern come from config unless REGISTRY_LOG_LEVEL or
// REGISTRY_LOG_PATTERN is set. Calling it again reconfigures the same logger.
void InitializeLogging(const registry::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace registry::observability

#define REGISTRY_LOG_DEBUG(message, ...) ::registry::observability::Log(::spdlog::level::debug, (message), ##__VA_ARGS__)
#define REGISTRY_LOG_INFO(message, ...) ::registry::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define REGISTRY_LOG_WARN(message, ...) ::registry::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define REGISTRY_LOG_ERROR(message, ...) ::registry::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
