#pragma once

#include <memory>

#include <spdlog/spdlog.h>

template<typename T> using Ref = std::shared_ptr<T>;

class Log {
 public:
  // Safe to call more than once; later calls only change the level.
  static void Init(spdlog::level::level_enum level = spdlog::level::trace);
  static void SetLevel(spdlog::level::level_enum level);

  static Ref<spdlog::logger>& GetCoreLogger();
  static Ref<spdlog::logger>& GetClientLogger();

 private:
  static Ref<spdlog::logger> s_CoreLogger;
  static Ref<spdlog::logger> s_ClientLogger;
};

// Core (library) log macros
#define TD_CORE_TRACE(...)    ::Log::GetCoreLogger()->trace(__VA_ARGS__)
#define TD_CORE_INFO(...)     ::Log::GetCoreLogger()->info(__VA_ARGS__)
#define TD_CORE_WARN(...)     ::Log::GetCoreLogger()->warn(__VA_ARGS__)
#define TD_CORE_ERROR(...)    ::Log::GetCoreLogger()->error(__VA_ARGS__)
#define TD_CORE_CRITICAL(...) ::Log::GetCoreLogger()->critical(__VA_ARGS__)

// Client (app) log macros
#define TD_TRACE(...)         ::Log::GetClientLogger()->trace(__VA_ARGS__)
#define TD_INFO(...)          ::Log::GetClientLogger()->info(__VA_ARGS__)
#define TD_WARN(...)          ::Log::GetClientLogger()->warn(__VA_ARGS__)
#define TD_ERROR(...)         ::Log::GetClientLogger()->error(__VA_ARGS__)
#define TD_CRITICAL(...)      ::Log::GetClientLogger()->critical(__VA_ARGS__)
