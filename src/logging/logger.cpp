/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "logging/logger.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tfc {

static constexpr const char *LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

LogLevel parse_log_level(const std::string &name) {
  if (name == "trace")
    return LogLevel::trace;
  if (name == "debug")
    return LogLevel::debug;
  if (name == "warn" || name == "warning")
    return LogLevel::warn;
  if (name == "error")
    return LogLevel::err;
  if (name == "critical")
    return LogLevel::critical;
  if (name == "off")
    return LogLevel::off;
  return LogLevel::info;
}

// Console loggers are registered and shared by name. File loggers are private to their owner,
// so two owners with the same name can write to different files.
static std::shared_ptr<spdlog::logger> shared_console_logger(const std::string &name) {
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  try {
    return spdlog::stdout_color_mt(name);
  } catch (const spdlog::spdlog_ex &) {
    // registered by another thread in the meantime
    auto existing = spdlog::get(name);
    if (!existing) {
      throw;
    }
    return existing;
  }
}

static std::shared_ptr<spdlog::logger> private_file_logger(const std::string &name,
                                                           const std::string &log_file) {
  auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file);
  return std::make_shared<spdlog::logger>(name, std::move(sink));
}

Logger::Logger(const std::string &name, const std::string &log_file, LogLevel level)
    : logger_name_(name) {
  logger_ = log_file.empty() ? shared_console_logger(name) : private_file_logger(name, log_file);
  logger_->set_level(level);
  logger_->set_pattern(LOG_PATTERN);
}

void Logger::set_level(spdlog::level::level_enum level) {
  if (logger_) {
    logger_->set_level(level);
  }
}

void Logger::set_log_file(const std::string &log_file) {
  LogLevel level = logger_ ? logger_->level() : LogLevel::info;
  logger_ = private_file_logger(logger_name_, log_file);
  logger_->set_level(level);
  logger_->set_pattern(LOG_PATTERN);
}

void Logger::flush() {
  if (logger_) {
    logger_->flush();
  }
}

} // namespace tfc
