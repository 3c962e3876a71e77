#pragma once

//
// ... Standard header files
//
#include <cmath>
#include <cstdlib>
#include <type_traits>
#include <utility>
#include <vector>

//
// ... sparcon header files
//
#include <sparcon/config.hpp>
#include <sparcon/data/Compressed_matrix.hpp>
#include <sparcon/data/Dense_view.hpp>

namespace sparcon::data::detail {

  namespace dense_details {

    /// @brief True when |x| > epsilon, for epsilon >= 0. Integers are
    /// compared without abs so that the most negative value is handled.
    template<typename T>
    bool
    exceeds(T const& x, T const& epsilon)
    {
      if constexpr (std::is_integral_v<T>) {
        return x > epsilon || x < -epsilon;
      } else {
        using std::abs;
        return abs(x) > epsilon;
      }
    }

  } // end of namespace dense_details

  /**
   * @brief Compress a dense matrix into row-major storage, keeping the
   * entries whose magnitude is strictly greater than @p epsilon.
   *
   * A negative @p epsilon is clamped to zero, so exact zeros are always
   * dropped.
   */
  template<typename T>
  Compressed_matrix<T>
  compressed_row_from_dense(Dense_view<T> const& m, T epsilon)
  {
    static_assert(std::is_arithmetic_v<T> && std::is_signed_v<T>,
                  "dense conversion requires a signed arithmetic type");

    using dense_details::exceeds;
    epsilon = epsilon > T{0} ? epsilon : T{0};
    auto rows = m.rows();
    auto cols = m.columns();

    // First pass: row pointer from per-row counts
    std::vector<config::size_type> row_ptr(static_cast<std::size_t>(rows + 1), 0);
    config::size_type nnz = 0;
    for (config::size_type i = 0; i < rows; ++i) {
      for (config::size_type j = 0; j < cols; ++j) {
        if (exceeds(m(i, j), epsilon)) { ++nnz; }
      }
      row_ptr[static_cast<std::size_t>(i + 1)] = nnz;
    }

    // Second pass: column indices and values, left to right
    std::vector<config::size_type> col_ind;
    std::vector<T> values;
    col_ind.reserve(static_cast<std::size_t>(nnz));
    values.reserve(static_cast<std::size_t>(nnz));
    for (config::size_type i = 0; i < rows; ++i) {
      for (config::size_type j = 0; j < cols; ++j) {
        auto const& x = m(i, j);
        if (exceeds(x, epsilon)) {
          col_ind.push_back(j);
          values.push_back(x);
        }
      }
    }

    return Compressed_matrix<T>{
      Storage::row_major, m.shape(),
      std::move(row_ptr), std::move(col_ind), std::move(values)};
  }

  /**
   * @brief Compress a dense matrix into column-major storage, keeping the
   * entries whose magnitude is strictly greater than @p epsilon.
   *
   * The rows of the transposed view are the columns of @p m, so its CSR
   * arrays are the CSC arrays of @p m.
   */
  template<typename T>
  Compressed_matrix<T>
  compressed_column_from_dense(Dense_view<T> const& m, T epsilon)
  {
    return transpose(compressed_row_from_dense(m.transposed(), epsilon));
  }

} // end of namespace sparcon::data::detail
