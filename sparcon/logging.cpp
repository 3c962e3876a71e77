#include <sparcon/logging.hpp>

//
// ... External header files
//
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

//
// ... sparcon header files
//
#include <sparcon/config.hpp>

namespace sparcon {

  namespace {

    std::shared_ptr<spdlog::logger>
    make_logger()
    {
      if (auto existing = spdlog::get(config::logger_name)) {
        return existing;
      }

      try {
        auto created = spdlog::stderr_color_mt(config::logger_name);
        created->set_level(spdlog::level::warn);
        spdlog::cfg::load_env_levels();
        return created;
      } catch (spdlog::spdlog_ex const&) {
        // Registered concurrently by another thread.
        return spdlog::get(config::logger_name);
      }
    }

  } // end of anonymous namespace

  std::shared_ptr<spdlog::logger>
  logger()
  {
    static std::shared_ptr<spdlog::logger> instance = make_logger();
    return instance;
  }

} // end of namespace sparcon
