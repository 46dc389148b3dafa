#pragma once

#include <charconv>
#include <concepts>
#include <istream>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include <fmt/core.h>

#include <specdeform/core/errors.hpp>
#include <specdeform/core/log.hpp>

namespace specdeform::core {

/// \brief Value types accepted from the command line.
template <typename T>
concept InputValue = std::same_as<T, int> || std::same_as<T, double>;

namespace detail {

inline std::string_view trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

} // namespace detail

/**
 * \brief Parse a whole string as `T`.
 * \throws InvalidArgumentType if `text` is empty, not a number, or has
 * trailing characters.
 */
template <InputValue T> T parse_value(std::string_view text) {
  const std::string_view body = detail::trim(text);
  T value{};
  const char *first = body.data();
  const char *last = body.data() + body.size();
  // from_chars rejects a leading '+'.
  if (first != last && *first == '+') {
    ++first;
  }
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (body.empty() || ec != std::errc() || ptr != last) {
    throw InvalidArgumentType(fmt::format("'{}' is not a valid {}", text,
                                          std::same_as<T, int> ? "integer" : "number"));
  }
  return value;
}

/**
 * \brief Take a value from the single positional argument, or `default_value`.
 * \throws InvalidArgumentType for an unparsable argument.
 * \throws std::invalid_argument when more than one argument is given.
 */
template <InputValue T>
T input_value(int argc, const char *const *argv, T default_value) {
  const Logger logger("input_value");
  if (argc > 2) {
    logger.error("Too many input arguments");
    throw std::invalid_argument(
        fmt::format("expected at most one argument, got {}", argc - 1));
  }
  if (argc == 2) {
    try {
      return parse_value<T>(argv[1]);
    } catch (const InvalidArgumentType &) {
      logger.error("Invalid argument");
      throw;
    }
  }
  return default_value;
}

/**
 * \brief Prompt on `out` until a value in `[min_value, max_value]` is read.
 *
 * Invalid or out-of-range entries are logged and re-prompted.
 * \return The chosen value; `std::nullopt` on `q` or end of input.
 */
template <InputValue T>
std::optional<T> input_value_within(T min_value, T max_value, std::istream &in,
                                    std::ostream &out,
                                    LogLevel level = LogLevel::Info) {
  const Logger logger("input_value_within", level);
  std::string line;
  while (true) {
    out << fmt::format("Enter a value in [{}, {}] or q to quit: ", min_value,
                       max_value)
        << std::flush;
    if (!std::getline(in, line)) {
      return std::nullopt;
    }

    const std::string_view entry = detail::trim(line);
    if (entry == "q" || entry == "Q") {
      logger.info("Quit");
      return std::nullopt;
    }

    try {
      const T chosen = parse_value<T>(entry);
      if (min_value <= chosen && chosen <= max_value) {
        return chosen;
      }
      logger.error("Out of range");
    } catch (const InvalidArgumentType &) {
      logger.error("Invalid input");
    }
  }
}

} // namespace specdeform::core
