#pragma once

#include <cctype>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/chrono.h>
#include <fmt/core.h>

namespace specdeform::core {

/// \brief Message severity, ordered from most to least verbose.
enum class LogLevel {
  Debug = 10,
  Info = 20,
  Warning = 30,
  Error = 40,
  Critical = 50
};

/**
 * \brief Upper-case tag used in log lines.
 * \param level Severity.
 * \return Tag such as `INFO`.
 */
inline std::string_view log_level_name(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARNING";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Critical:
    return "CRITICAL";
  }
  return "UNKNOWN";
}

/**
 * \brief Parse a severity name (case-insensitive).
 * \param text One of `debug`, `info`, `warning`, `error`, `critical`.
 * \return Parsed severity.
 * \throws std::invalid_argument for any other input.
 */
inline LogLevel parse_log_level(std::string_view text) {
  std::string value(text);
  for (char &c : value) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  if (value == "debug") {
    return LogLevel::Debug;
  }
  if (value == "info") {
    return LogLevel::Info;
  }
  if (value == "warning" || value == "warn") {
    return LogLevel::Warning;
  }
  if (value == "error") {
    return LogLevel::Error;
  }
  if (value == "critical") {
    return LogLevel::Critical;
  }
  throw std::invalid_argument("Invalid log level: '" + std::string(text) + "'");
}

/// \brief Serializes writes from loggers sharing a sink.
inline std::mutex &log_sink_mutex() {
  static std::mutex mutex;
  return mutex;
}

/**
 * \brief Named, leveled diagnostic sink.
 *
 * Lines have the form `/LEVEL/ [YYYY-mm-dd HH:MM:SS] name: message`.
 * Messages below the logger level are dropped.
 */
class Logger {
public:
  explicit Logger(std::string name, LogLevel level = LogLevel::Info,
                  std::FILE *sink = stderr)
      : name_(std::move(name)), level_(level), sink_(sink) {}

  [[nodiscard]] const std::string &name() const { return name_; }
  [[nodiscard]] LogLevel level() const { return level_; }

  [[nodiscard]] bool enabled(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(level_);
  }

  void debug(std::string_view message) const { log(LogLevel::Debug, message); }
  void info(std::string_view message) const { log(LogLevel::Info, message); }
  void warning(std::string_view message) const {
    log(LogLevel::Warning, message);
  }
  void error(std::string_view message) const { log(LogLevel::Error, message); }
  void critical(std::string_view message) const {
    log(LogLevel::Critical, message);
  }

  /**
   * \brief Log a framed block of `key = value` parameter lines at info level.
   * \param params Pairs of parameter name and formatted value.
   */
  template <typename... Params> void show_params(const Params &...params) const {
    info("----- Parameters -----");
    (info(fmt::format("{} = {}", params.first, params.second)), ...);
    info("----------------------");
  }

  /**
   * \brief Write one line at `level` if enabled.
   * \param level Severity.
   * \param message Message body.
   */
  void log(LogLevel level, std::string_view message) const {
    if (!enabled(level) || sink_ == nullptr) {
      return;
    }

    const std::string line =
        fmt::format("/{}/ [{:%Y-%m-%d %H:%M:%S}] {}: {}\n",
                    log_level_name(level), fmt::localtime(std::time(nullptr)),
                    name_, message);

    std::lock_guard<std::mutex> lock(log_sink_mutex());
    std::fputs(line.c_str(), sink_);
    std::fflush(sink_);
  }

private:
  std::string name_;
  LogLevel level_ = LogLevel::Info;
  std::FILE *sink_ = nullptr;
};

} // namespace specdeform::core
