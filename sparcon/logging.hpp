#pragma once

//
// ... Standard header files
//
#include <memory>

//
// ... External header files
//
#include <spdlog/spdlog.h>

namespace sparcon {

  /**
   * @brief Return the library logger.
   *
   * The logger is a thread-safe color console logger named
   * config::logger_name. It is created on first use with level @c warn,
   * after which levels from the @c SPDLOG_LEVEL environment variable are
   * applied. A logger of the same name registered by the application
   * beforehand is used as-is.
   */
  std::shared_ptr<spdlog::logger>
  logger();

} // end of namespace sparcon
