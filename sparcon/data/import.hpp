#pragma once

//
// ... Standard header files
//
#include <cstdint>
#include <stdexcept>
#include <vector>

//
// ... External header files
//
#include <nlohmann/json.hpp>

namespace sparcon::data::detail {

  using size_type = std::ptrdiff_t;

  using nlohmann::json;

  using std::vector;

  using std::invalid_argument;
  using std::logic_error;

} // end of namespace sparcon::data::detail
