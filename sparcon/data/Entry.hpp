#pragma once

//
// ... sparcon header files
//
#include <sparcon/config.hpp>
#include <sparcon/data/Index.hpp>

namespace sparcon::data::detail {

  /// @brief One triplet of a coordinate matrix.
  template<typename T = config::value_type>
  struct Entry
  {
    Index index;
    T value;

    friend bool
    operator==(Entry const& a, Entry const& b)
    {
      return a.index == b.index && a.value == b.value;
    }
  };

} // end of namespace sparcon::data::detail
