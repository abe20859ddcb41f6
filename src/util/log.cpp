#include "model_cache/log.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace model_cache {

std::shared_ptr<spdlog::logger> logger() {
  static std::mutex mu;
  std::lock_guard<std::mutex> lock(mu);
  auto log = spdlog::get(kLoggerName);
  if (log)
    return log;
  try {
    log = spdlog::stdout_color_mt(kLoggerName);
    log->set_level(spdlog::level::info);
  } catch (const spdlog::spdlog_ex &) {
    // Registered by the application between the lookup and the create.
    log = spdlog::get(kLoggerName);
  }
  return log;
}

} // namespace model_cache
