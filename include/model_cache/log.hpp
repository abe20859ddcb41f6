#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace model_cache {

constexpr const char *kLoggerName = "model_cache";

// Returns the registered "model_cache" logger, creating a stdout colour
// logger on first use when the application has not installed its own.
std::shared_ptr<spdlog::logger> logger();

} // namespace model_cache
