#pragma once

#include <cctype>
#include <cstdlib>
#include <string>
#include <thread>

#include <specdeform/core/log.hpp>

namespace specdeform::core {

/// \brief Runtime compute backend choice.
enum class ComputeBackend {
  Cpu,
  CpuParallel
};

/**
 * \brief Hardware concurrency with safe fallback to `1`.
 * \return Hardware thread count.
 */
inline int hardware_thread_count() {
  const unsigned hw = std::thread::hardware_concurrency();
  if (hw == 0) {
    return 1;
  }
  return static_cast<int>(hw);
}

/**
 * \brief Process-wide settings resolved once by an entry point.
 *
 * Library functions that need these settings take a `RuntimeConfig`
 * argument; nothing reads the environment behind the caller's back.
 */
struct RuntimeConfig {
  /// \brief Serial or pooled execution of index loops.
  ComputeBackend backend = ComputeBackend::CpuParallel;
  /// \brief Requested worker count; `0` selects hardware concurrency.
  int num_threads = 0;
  /// \brief Threshold for loggers created by the entry point.
  LogLevel log_level = LogLevel::Info;

  /**
   * \brief Effective number of loop participants.
   * \return `1` for the serial backend, otherwise the requested or hardware
   * thread count.
   */
  [[nodiscard]] int resolved_thread_count() const {
    if (backend == ComputeBackend::Cpu) {
      return 1;
    }
    return num_threads > 0 ? num_threads : hardware_thread_count();
  }

  /**
   * \brief Read `SPECDEFORM_BACKEND`, `SPECDEFORM_NUM_THREADS` and
   * `SPECDEFORM_LOG_LEVEL`.
   * \return Configuration with defaults for unset variables.
   * \throws std::invalid_argument for an unknown log level.
   */
  static RuntimeConfig from_env() {
    RuntimeConfig config;

    if (const char *raw = std::getenv("SPECDEFORM_BACKEND"); raw != nullptr) {
      std::string value(raw);
      for (char &c : value) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      }
      config.backend =
          value == "cpu" ? ComputeBackend::Cpu : ComputeBackend::CpuParallel;
    }

    if (const char *raw = std::getenv("SPECDEFORM_NUM_THREADS"); raw != nullptr) {
      const int requested = std::atoi(raw);
      if (requested > 0) {
        config.num_threads = requested;
      }
    }

    if (const char *raw = std::getenv("SPECDEFORM_LOG_LEVEL"); raw != nullptr) {
      config.log_level = parse_log_level(raw);
    }

    return config;
  }
};

} // namespace specdeform::core
