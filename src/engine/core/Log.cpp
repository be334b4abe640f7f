#include "core/Log.h"

#include <spdlog/sinks/stdout_color_sinks.h>

Ref<spdlog::logger> Log::s_CoreLogger;
Ref<spdlog::logger> Log::s_ClientLogger;

void Log::Init(spdlog::level::level_enum level) {
  if (s_CoreLogger && s_ClientLogger) {
    s_CoreLogger->set_level(level);
    s_ClientLogger->set_level(level);
    return;
  }

  auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  sink->set_pattern("%^[%T] %n: %v%$");

  s_CoreLogger = std::make_shared<spdlog::logger>("TABLEDROP", sink);
  s_CoreLogger->set_level(level);
  s_CoreLogger->flush_on(spdlog::level::warn);

  s_ClientLogger = std::make_shared<spdlog::logger>("APP", sink);
  s_ClientLogger->set_level(level);
  s_ClientLogger->flush_on(spdlog::level::warn);
}

void Log::SetLevel(spdlog::level::level_enum level) {
  Init(level);
}

// Lazily initialised so the library can log before an app calls Init().
Ref<spdlog::logger>& Log::GetCoreLogger() {
  if (!s_CoreLogger) Init(spdlog::level::info);
  return s_CoreLogger;
}

Ref<spdlog::logger>& Log::GetClientLogger() {
  if (!s_ClientLogger) Init(spdlog::level::info);
  return s_ClientLogger;
}
