// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace rttfuzz {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout the driver, the replay tool and the fuzz targets.
 *
 * Thread-safety: All methods are thread-safe. The logger map is
 * protected by a mutex; it is built by the first Initialize() and
 * again by the first Initialize() after Shutdown().
 */
class LogManager {
public:
  // Initialize logging system with the specified minimum log level.
  // No-op while loggers exist; after Shutdown() it rebuilds them with the new settings.
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "rttfuzz.log");

  // Shutdown logging system (flushes buffers).
  // Later logging without Initialize() recreates the loggers at "off".
  static void Shutdown();

  // Get logger for specific component ("driver", "rules").
  // Auto-initializes if not initialized. Unknown components get the default logger.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for a specific component (driver, rules, default).
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace rttfuzz

// Convenience macros for logging
#define LOG_TRACE(...) rttfuzz::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) rttfuzz::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) rttfuzz::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) rttfuzz::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) rttfuzz::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_DRIVER_TRACE(...) rttfuzz::util::LogManager::GetLogger("driver")->trace(__VA_ARGS__)
#define LOG_DRIVER_DEBUG(...) rttfuzz::util::LogManager::GetLogger("driver")->debug(__VA_ARGS__)
#define LOG_DRIVER_INFO(...) rttfuzz::util::LogManager::GetLogger("driver")->info(__VA_ARGS__)
#define LOG_DRIVER_WARN(...) rttfuzz::util::LogManager::GetLogger("driver")->warn(__VA_ARGS__)
#define LOG_DRIVER_ERROR(...) rttfuzz::util::LogManager::GetLogger("driver")->error(__VA_ARGS__)

#define LOG_RULES_TRACE(...) rttfuzz::util::LogManager::GetLogger("rules")->trace(__VA_ARGS__)
#define LOG_RULES_DEBUG(...) rttfuzz::util::LogManager::GetLogger("rules")->debug(__VA_ARGS__)
#define LOG_RULES_INFO(...) rttfuzz::util::LogManager::GetLogger("rules")->info(__VA_ARGS__)
#define LOG_RULES_WARN(...) rttfuzz::util::LogManager::GetLogger("rules")->warn(__VA_ARGS__)
#define LOG_RULES_ERROR(...) rttfuzz::util::LogManager::GetLogger("rules")->error(__VA_ARGS__)
