#pragma once

//
// ... Standard header files
//
#include <span>

//
// ... sparcon header files
//
#include <sparcon/config.hpp>
#include <sparcon/data/Shape.hpp>
#include <sparcon/data/Storage.hpp>

namespace sparcon::data::detail {

  /// @brief Number of outer slots of a @p storage matrix of @p shape.
  config::size_type
  outer_dim(Storage storage, Shape shape);

  /// @brief Length of each outer slot of a @p storage matrix of @p shape.
  config::size_type
  inner_dim(Storage storage, Shape shape);

  /**
   * @brief Check that raw arrays describe a compressed matrix.
   *
   * The arrays are valid when
   *   - @p outer_ptr has outer_dim + 1 elements, starts at zero and never
   *     decreases,
   *   - its last element equals the length of @p inner_ind,
   *   - @p value_count equals the length of @p inner_ind,
   *   - every inner index lies in [0, inner_dim) and the indices of each
   *     outer slot are strictly increasing.
   *
   * @throws Structure_error naming the first violation found.
   */
  void
  check_compressed_structure(
    Storage storage,
    Shape shape,
    std::span<config::size_type const> outer_ptr,
    std::span<config::size_type const> inner_ind,
    config::size_type value_count);

} // end of namespace sparcon::data::detail
