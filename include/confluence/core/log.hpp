#pragma once
#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/cfg/env.h>

namespace confluence::logging {

inline constexpr const char* logger_name = "confluence";

// Shared library logger, registered under "confluence" so an application can
// reach it through the spdlog registry (levels, sinks, pattern).
inline std::shared_ptr<spdlog::logger> logger() {
  static std::shared_ptr<spdlog::logger> instance = []{
    if (auto existing = spdlog::get(logger_name)) return existing;
    try {
      return spdlog::stderr_color_mt(logger_name);
    } catch (const spdlog::spdlog_ex&) {
      // lost the registration race against another thread
      return spdlog::get(logger_name);
    }
  }();
  return instance;
}

inline void set_level(spdlog::level::level_enum lvl) {
  logger()->set_level(lvl);
}

// Reads SPDLOG_LEVEL, e.g. SPDLOG_LEVEL=confluence=debug
inline void load_env_levels() {
  spdlog::cfg::load_env_levels();
}

} // namespace confluence::logging
