#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include <specdeform/core/errors.hpp>
#include <specdeform/core/input.hpp>

using namespace specdeform;

TEST_CASE("Whole-string parsing of integers and doubles") {
  CHECK(core::parse_value<int>("42") == 42);
  CHECK(core::parse_value<int>(" +7 ") == 7);
  CHECK(core::parse_value<int>("-3") == -3);
  CHECK(core::parse_value<double>("2.5") == doctest::Approx(2.5));
  CHECK(core::parse_value<double>("1e-3") == doctest::Approx(1e-3));

  CHECK_THROWS_AS(core::parse_value<int>(""), core::InvalidArgumentType);
  CHECK_THROWS_AS(core::parse_value<int>("abc"), core::InvalidArgumentType);
  CHECK_THROWS_AS(core::parse_value<int>("4.5"), core::InvalidArgumentType);
  CHECK_THROWS_AS(core::parse_value<double>("1.0x"), core::InvalidArgumentType);
}

TEST_CASE("Positional argument overrides the default") {
  const char *no_args[] = {"prog"};
  CHECK(core::input_value<int>(1, no_args, 32) == 32);

  const char *one_arg[] = {"prog", "48"};
  CHECK(core::input_value<int>(2, one_arg, 32) == 48);

  const char *bad_arg[] = {"prog", "many"};
  CHECK_THROWS_AS(core::input_value<int>(2, bad_arg, 32), core::InvalidArgumentType);

  const char *two_args[] = {"prog", "1", "2"};
  CHECK_THROWS_AS(core::input_value<int>(3, two_args, 32), std::invalid_argument);
}

TEST_CASE("Interactive input re-prompts until a value is in range") {
  std::istringstream in("abc\n20\n3\n");
  std::ostringstream out;
  const std::optional<int> value =
      core::input_value_within(1, 10, in, out, core::LogLevel::Critical);
  REQUIRE(value.has_value());
  CHECK(*value == 3);

  const std::string prompt = "Enter a value in [1, 10] or q to quit: ";
  const std::string shown = out.str();
  CHECK(shown == prompt + prompt + prompt);
}

TEST_CASE("Interactive input can be abandoned") {
  std::ostringstream out;

  std::istringstream quit("q\n");
  CHECK_FALSE(core::input_value_within(0.0, 1.0, quit, out, core::LogLevel::Critical)
                  .has_value());

  std::istringstream empty("");
  CHECK_FALSE(core::input_value_within(0, 5, empty, out, core::LogLevel::Critical)
                  .has_value());

  std::istringstream bounds("0.0\n");
  const auto lower = core::input_value_within(0.0, 1.0, bounds, out,
                                              core::LogLevel::Critical);
  REQUIRE(lower.has_value());
  CHECK(*lower == 0.0);
}
