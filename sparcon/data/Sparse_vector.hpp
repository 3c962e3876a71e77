#pragma once

//
// ... Standard header files
//
#include <span>

//
// ... sparcon header files
//
#include <sparcon/config.hpp>

namespace sparcon::data::detail {

  /**
   * @brief Borrowed view of one outer slot of a compressed matrix.
   *
   * @c indices holds the sorted inner indices of the stored entries and
   * @c values the parallel values. @c dim is the length of the dense
   * vector the view represents, i.e. the inner dimension of the matrix
   * it was taken from.
   */
  template<typename T = config::value_type>
  struct Sparse_vector_view
  {
    config::size_type dim;
    std::span<config::size_type const> indices;
    std::span<T const> values;

    config::size_type
    size() const
    {
      return static_cast<config::size_type>(indices.size());
    }
  };

} // end of namespace sparcon::data::detail
