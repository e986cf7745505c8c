#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace mc3d::runtime::config {
class RuntimeConfig;
}

namespace mc3d::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const mc3d::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

inline void LogCritical(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::critical, message, fields);
}

} // namespace mc3d::observability

#define MC3D_LOG_DEBUG(message, ...) ::mc3d::observability::LogDebug((message), ##__VA_ARGS__)
#define MC3D_LOG_INFO(message, ...) ::mc3d::observability::LogInfo((message), ##__VA_ARGS__)
#define MC3D_LOG_WARN(message, ...) ::mc3d::observability::LogWarn((message), ##__VA_ARGS__)
#define MC3D_LOG_ERROR(message, ...) ::mc3d::observability::LogError((message), ##__VA_ARGS__)
#define MC3D_LOG_CRITICAL(message, ...) ::mc3d::observability::LogCritical((message), ##__VA_ARGS__)
