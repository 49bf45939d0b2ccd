#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/ids.hpp"

namespace catalog::runtime::config {
class RuntimeConfig;
}

namespace catalog::observability {

/*
  Structured logging on top of spdlog.

  A record is the message followed by key=value fields. Values containing
  whitespace, quotes or '=' are double quoted so error messages stay one
  field.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Error context stack, outermost frame last, joined with " | ".
LogField StackField(std::string_view key, const std::vector<std::string>& stack);

template <typename Tag>
LogField IdField(std::string_view key, const model::TypedId<Tag>& id) {
  return StringField(key, id.ToString());
}

// Formats fields the way Log() appends them to the message.
std::string FormatFields(std::initializer_list<LogField> fields);

// Env (CATALOG_LOG_LEVEL / CATALOG_LOG_PATTERN) wins over the config file.
void InitializeLogging(const catalog::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace catalog::observability

#define CATALOG_LOG_INFO(message, ...) ::catalog::observability::LogInfo((message), ##__VA_ARGS__)
#define CATALOG_LOG_WARN(message, ...) ::catalog::observability::LogWarn((message), ##__VA_ARGS__)
#define CATALOG_LOG_ERROR(message, ...) ::catalog::observability::LogError((message), ##__VA_ARGS__)
