#pragma once

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#define WAYFINDER_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define WAYFINDER_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define WAYFINDER_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define WAYFINDER_WARN(...) SPDLOG_WARN(__VA_ARGS__)

namespace wayfinder {
namespace base {
inline void InitializeLogging() { spdlog::cfg::load_env_levels(); }
} // namespace base
} // namespace wayfinder
