#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace flightrec::config {
class RuntimeConfig;
}

namespace flightrec::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

/*
  Fields bound to every log line written on this thread while the
  scope is alive:

      LogContext ctx({StringField("replay_id", id)});
      FLIGHTREC_LOG_INFO("step");   // step replay_id=...

  Scopes nest and unwind in reverse order; an inner scope shadows an
  outer one with the same key. A key passed directly to Log wins over
  the context.
*/
class LogContext {
 public:
  explicit LogContext(std::initializer_list<LogField> fields);
  ~LogContext();

  LogContext(const LogContext&)            = delete;
  LogContext& operator=(const LogContext&) = delete;

 private:
  std::size_t restore_size_;
};

// Snapshot of the fields bound on the calling thread, outermost first.
std::vector<LogField> CurrentLogContext();

void InitializeLogging(const flightrec::config::RuntimeConfig& config);
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

} // namespace flightrec::observability

#define FLIGHTREC_LOG_DEBUG(message, ...) ::flightrec::observability::LogDebug((message), ##__VA_ARGS__)
#define FLIGHTREC_LOG_INFO(message, ...) ::flightrec::observability::LogInfo((message), ##__VA_ARGS__)
#define FLIGHTREC_LOG_WARN(message, ...) ::flightrec::observability::LogWarn((message), ##__VA_ARGS__)
#define FLIGHTREC_LOG_ERROR(message, ...) ::flightrec::observability::LogError((message), ##__VA_ARGS__)
