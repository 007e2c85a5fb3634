/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <memory>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>

namespace tfc {

typedef spdlog::level::level_enum LogLevel;

/**
 * @brief Parses "trace", "debug", "info", "warn", "error", "critical" or "off".
 * Unknown names fall back to info.
 */
LogLevel parse_log_level(const std::string &name);

class Logger {
public:
  Logger(const std::string &name = "default_logger", const std::string &log_file = "",
         LogLevel level = LogLevel::info);

  ~Logger() = default;

  void set_level(LogLevel level);
  /**
   * @brief Moves this logger to its own file sink. Other loggers sharing the name keep theirs.
   */
  void set_log_file(const std::string &log_file);
  void flush();

  const std::string &name() const { return logger_name_; }

  template <typename... Args> void trace(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (logger_)
      logger_->trace(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args> void debug(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (logger_)
      logger_->debug(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args> void info(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (logger_)
      logger_->info(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args> void warn(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (logger_)
      logger_->warn(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args> void error(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (logger_)
      logger_->error(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args> void critical(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (logger_)
      logger_->critical(fmt, std::forward<Args>(args)...);
  }

  void log_runtime(LogLevel level, std::string_view msg) {
    if (logger_)
      logger_->log(level, msg);
  }

private:
  std::shared_ptr<spdlog::logger> logger_;
  std::string logger_name_;
};

class GlobalLogger {
private:
  static Logger &instance() {
    static Logger global_logger("tfc", "", spdlog::level::info);
    return global_logger;
  }

public:
  static void set_level(LogLevel level) { instance().set_level(level); }
  static void set_log_file(const std::string &log_file) { instance().set_log_file(log_file); }

  template <typename... Args>
  static void debug(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    instance().debug(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void info(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    instance().info(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void warn(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    instance().warn(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void error(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    instance().error(fmt, std::forward<Args>(args)...);
  }
};

} // namespace tfc
