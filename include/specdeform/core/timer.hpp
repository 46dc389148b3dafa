#pragma once

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <optional>
#include <string>
#include <utility>

#include <fmt/core.h>

#include <specdeform/core/log.hpp>

namespace specdeform::core {

/**
 * \brief Wall-clock timer reporting through a named logger.
 *
 * `lap()` measures split times independently of `start()`: the first call
 * only sets the split point.
 */
class Timer {
public:
  explicit Timer(std::string name, LogLevel level = LogLevel::Info)
      : logger_(std::move(name), level) {}

  /// \brief Reset and start measuring.
  void start() {
    logger_.info("Start");
    start_ = Clock::now();
  }

  /// \return Seconds since `start()`, or `std::nullopt` if never started.
  [[nodiscard]] std::optional<double> elapsed() const {
    if (!start_.has_value()) {
      return std::nullopt;
    }
    return std::chrono::duration<double>(Clock::now() - *start_).count();
  }

  /// \brief Log the elapsed time, or a warning if the timer was not started.
  void show() const {
    const auto seconds = elapsed();
    if (!seconds.has_value()) {
      logger_.warning("Timer has not been started.");
      return;
    }
    logger_.info(fmt::format("Elapsed time: {:.1f} sec.", *seconds));
  }

  /// \brief Log the elapsed time and an end marker.
  void end() const {
    show();
    logger_.info("End");
  }

  /// \return Seconds since the previous lap; `std::nullopt` on the first call.
  std::optional<double> lap() {
    const auto now = Clock::now();
    if (!split_.has_value()) {
      split_ = now;
      return std::nullopt;
    }
    const double seconds = std::chrono::duration<double>(now - *split_).count();
    split_ = now;
    return seconds;
  }

private:
  using Clock = std::chrono::steady_clock;

  Logger logger_;
  std::optional<Clock::time_point> start_;
  std::optional<Clock::time_point> split_;
};

/**
 * \brief Single-line text progress bar for long loops.
 *
 * Drawn as `name |####      |  40% [1.2 sec.]` with carriage-return
 * redraws; the line is terminated once `done` reaches `total`.
 */
class ProgressBar {
public:
  static constexpr int kBarWidth = 10;
  static constexpr std::size_t kMaxNameLength = 15;

  ProgressBar(std::string name, int total, std::FILE *out = stderr,
              LogLevel level = LogLevel::Info)
      : name_(std::move(name)), total_(total), out_(out), timer_(name_, level),
        logger_(name_, level) {
    display_name_ = name_.size() > kMaxNameLength
                        ? name_.substr(0, kMaxNameLength) + "..."
                        : name_;
    if (total_ <= 0) {
      logger_.warning("Invalid argument");
    }
  }

  [[nodiscard]] int total() const { return total_; }

  /**
   * \brief Text of the bar for `done` finished iterations.
   * \param done Finished iterations, clamped to `[0, total]`.
   * \param seconds Elapsed time shown after the percentage.
   */
  [[nodiscard]] std::string render(int done, double seconds) const {
    const int clamped = total_ > 0 ? std::clamp(done, 0, total_) : 1;
    const int denominator = total_ > 0 ? total_ : 1;
    const int filled = clamped * kBarWidth / denominator;
    std::string bar(static_cast<std::size_t>(filled), '#');
    bar.append(static_cast<std::size_t>(kBarWidth - filled), ' ');
    return fmt::format("{} |{}| {:3d}% [{:.1f} sec.]", display_name_, bar,
                       clamped * 100 / denominator, seconds);
  }

  /// \brief Start the timer and draw an empty bar.
  void start() {
    timer_.start();
    draw(0);
  }

  /// \brief Redraw after `done` iterations; finishes the line at `total`.
  void update(int done) {
    draw(done);
    if (done >= total_) {
      if (out_ != nullptr) {
        std::fputc('\n', out_);
      }
      timer_.end();
    }
  }

private:
  void draw(int done) {
    if (out_ == nullptr) {
      return;
    }
    const std::string line = render(done, timer_.elapsed().value_or(0.0));
    std::fputc('\r', out_);
    std::fputs(line.c_str(), out_);
    std::fflush(out_);
  }

  std::string name_;
  std::string display_name_;
  int total_ = 0;
  std::FILE *out_ = nullptr;
  Timer timer_;
  Logger logger_;
};

} // namespace specdeform::core
