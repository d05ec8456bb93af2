#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace waveq::runtime::config {
class RuntimeConfig;
}

namespace waveq::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

// "request_id=<id>", attached to every line that concerns one edit request.
LogField RequestField(std::string_view request_id);

void InitializeLogging(const waveq::runtime::config::RuntimeConfig& config);
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

} // namespace waveq::observability

#define WAVEQ_LOG_DEBUG(message, ...) ::waveq::observability::LogDebug((message), ##__VA_ARGS__)
#define WAVEQ_LOG_INFO(message, ...) ::waveq::observability::LogInfo((message), ##__VA_ARGS__)
#define WAVEQ_LOG_WARN(message, ...) ::waveq::observability::LogWarn((message), ##__VA_ARGS__)
#define WAVEQ_LOG_ERROR(message, ...) ::waveq::observability::LogError((message), ##__VA_ARGS__)
