//
// ... Test header files
//
#include <catch2/catch_test_macros.hpp>

//
// ... sparcon header files
//
#include <sparcon/config.hpp>
#include <sparcon/logging.hpp>

namespace sparcon::testing {

  TEST_CASE("logging - library_logger", "[logging]")
  {
    auto log = sparcon::logger();
    REQUIRE(log);
    CHECK(log->name() == sparcon::config::logger_name);
    CHECK(log == sparcon::logger());
  }

  TEST_CASE("logging - registered_with_spdlog", "[logging]")
  {
    auto log = sparcon::logger();
    CHECK(spdlog::get(sparcon::config::logger_name) == log);
  }

} // end of namespace sparcon::testing
