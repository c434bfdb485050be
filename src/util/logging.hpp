#pragma once

#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include "error.hpp"

#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>

namespace snapgate {

// Initialize the global logger. Should be called once at process startup.
// When log_file is non-empty, records are also appended to that file.
void initialize_logger(std::string_view app_name = "snapgate", const std::string& log_file = {});

// Appends records to `path` as well. Call during startup, before worker
// threads log.
[[nodiscard]] auto attach_log_file(const std::string& path) -> Result<void>;

// Get the global logger (for advanced usage)
[[nodiscard]] auto get_logger() -> std::shared_ptr<spdlog::logger>;

// Set log level at runtime
void set_log_level(spdlog::level::level_enum level);

// Maps a config level name ("trace" .. "critical") to an spdlog level
[[nodiscard]] auto parse_log_level(std::string_view name) -> std::optional<spdlog::level::level_enum>;

} // namespace snapgate

// Project-wide logging macros
// These wrap spdlog and use the global logger

#define SNAPGATE_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::snapgate::get_logger(), __VA_ARGS__)

#define SNAPGATE_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::snapgate::get_logger(), __VA_ARGS__)

#define SNAPGATE_LOG_INFO(...) SPDLOG_LOGGER_INFO(::snapgate::get_logger(), __VA_ARGS__)

#define SNAPGATE_LOG_WARN(...) SPDLOG_LOGGER_WARN(::snapgate::get_logger(), __VA_ARGS__)

#define SNAPGATE_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::snapgate::get_logger(), __VA_ARGS__)

#define SNAPGATE_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::snapgate::get_logger(), __VA_ARGS__)
