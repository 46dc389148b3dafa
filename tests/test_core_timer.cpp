#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <string>

#include <specdeform/core/timer.hpp>

using namespace specdeform;

TEST_CASE("Timer reports nothing until started") {
  core::Timer timer("timer", core::LogLevel::Critical);
  CHECK_FALSE(timer.elapsed().has_value());
  timer.show();

  timer.start();
  const auto elapsed = timer.elapsed();
  REQUIRE(elapsed.has_value());
  CHECK(*elapsed >= 0.0);
  timer.end();
}

TEST_CASE("Lap times start on the first call") {
  core::Timer timer("laps", core::LogLevel::Critical);
  CHECK_FALSE(timer.lap().has_value());
  const auto split = timer.lap();
  REQUIRE(split.has_value());
  CHECK(*split >= 0.0);
}

TEST_CASE("Progress bar text") {
  const core::ProgressBar bar("sweep", 10, nullptr, core::LogLevel::Critical);
  CHECK(bar.total() == 10);
  CHECK(bar.render(0, 0.0) == "sweep |          |   0% [0.0 sec.]");
  CHECK(bar.render(4, 1.23) == "sweep |####      |  40% [1.2 sec.]");
  CHECK(bar.render(10, 5.0) == "sweep |##########| 100% [5.0 sec.]");
  CHECK(bar.render(15, 5.0) == "sweep |##########| 100% [5.0 sec.]");

  SUBCASE("long names are truncated") {
    const core::ProgressBar long_bar("a_very_long_progress_name", 2, nullptr,
                                     core::LogLevel::Critical);
    CHECK(long_bar.render(1, 0.0) == "a_very_long_pro... |#####     |  50% [0.0 sec.]");
  }

  SUBCASE("updates without an output stream") {
    core::ProgressBar silent("silent", 3, nullptr, core::LogLevel::Critical);
    silent.start();
    for (int i = 1; i <= 3; ++i) {
      silent.update(i);
    }
    CHECK(silent.render(3, 0.0).find("100%") != std::string::npos);
  }
}
