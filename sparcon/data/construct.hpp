#pragma once

//
// ... Standard header files
//
#include <algorithm>
#include <functional>
#include <optional>
#include <string>
#include <vector>

//
// ... External header files
//
#include <spdlog/fmt/ranges.h>

//
// ... sparcon header files
//
#include <sparcon/config.hpp>
#include <sparcon/data/Compressed_matrix.hpp>
#include <sparcon/data/conversions.hpp>
#include <sparcon/data/errors.hpp>
#include <sparcon/logging.hpp>

namespace sparcon::data::detail {

  /// @brief Borrowed, ordered list of matrices to stack.
  template<typename T = config::value_type>
  using Matrix_list = std::vector<std::reference_wrapper<Compressed_matrix<T> const>>;

  /// @brief One cell of a block grid; std::nullopt stands for a zero block.
  template<typename T = config::value_type>
  using Block = std::optional<std::reference_wrapper<Compressed_matrix<T> const>>;

  /// @brief Block rows of a block grid.
  template<typename T = config::value_type>
  using Block_grid = std::vector<std::vector<Block<T>>>;

  /**
   * @brief Concatenate matrices sharing orientation and inner dimension
   * along their outer dimension.
   *
   * For row-major inputs this stacks vertically, for column-major inputs
   * horizontally. Outer slot k of the result is the k-th outer slot of the
   * inputs taken in list order.
   *
   * @throws Construction_error with kind
   *   - empty_stacking_list if @p mats is empty,
   *   - incompatible_dimensions if the inner dimensions differ,
   *   - incompatible_storages if the orientations differ.
   */
  template<typename T>
  Compressed_matrix<T>
  same_storage_fast_stack(Matrix_list<T> const& mats)
  {
    using Kind = Construction_error::Kind;

    if (mats.empty()) {
      throw Construction_error(Kind::empty_stacking_list, "nothing to stack");
    }

    Compressed_matrix<T> const& head = mats.front();
    auto inner_dim = head.inner_dim();
    auto storage = head.storage();

    for (Compressed_matrix<T> const& mat : mats) {
      if (mat.inner_dim() != inner_dim) {
        throw Construction_error(
          Kind::incompatible_dimensions,
          "inner dimension " + std::to_string(mat.inner_dim())
          + " does not match " + std::to_string(inner_dim));
      }
    }
    for (Compressed_matrix<T> const& mat : mats) {
      if (mat.storage() != storage) {
        throw Construction_error(
          Kind::incompatible_storages,
          to_string(mat.storage()) + " matrix among "
          + to_string(storage) + " matrices");
      }
    }

    config::size_type outer_dim = 0;
    config::size_type nnz = 0;
    for (Compressed_matrix<T> const& mat : mats) {
      outer_dim += mat.outer_dim();
      nnz += mat.size();
    }

    logger()->trace(
      "same_storage_fast_stack: {} {} matrices, outer {} inner {} nnz {}",
      mats.size(), to_string(storage), outer_dim, inner_dim, nnz);

    auto result = Compressed_matrix<T>::empty(storage, inner_dim);
    result.reserve_outer_exact(outer_dim);
    result.reserve_nnz_exact(nnz);
    for (Compressed_matrix<T> const& mat : mats) {
      for (config::size_type k = 0; k < mat.outer_dim(); ++k) {
        result.append_outer(mat.outer_vector(k));
      }
    }
    return result;
  }

  namespace stack_details {

    /**
     * @brief Stack @p mats after bringing each of them to @p storage.
     *
     * Conforming inputs are borrowed; the others are converted into
     * copies owned by this call.
     */
    template<typename T>
    Compressed_matrix<T>
    oriented_stack(Matrix_list<T> const& mats, Storage storage, char const* name)
    {
      auto conforming = std::all_of(
        mats.begin(), mats.end(),
        [storage](Compressed_matrix<T> const& mat) {
          return mat.storage() == storage;
        });
      if (conforming) { return same_storage_fast_stack(mats); }

      std::vector<Compressed_matrix<T>> converted;
      converted.reserve(mats.size());

      Matrix_list<T> stackable;
      stackable.reserve(mats.size());
      for (Compressed_matrix<T> const& mat : mats) {
        if (mat.storage() == storage) {
          stackable.push_back(std::cref(mat));
        } else {
          converted.push_back(to_storage(mat, storage));
          stackable.push_back(std::cref(converted.back()));
        }
      }

      logger()->debug(
        "{}: converted {} of {} matrices to {}",
        name, converted.size(), mats.size(), to_string(storage));

      return same_storage_fast_stack(stackable);
    }

  } // end of namespace stack_details

  /**
   * @brief Stack matrices with the same number of columns on top of one
   * another. The result is row-major.
   *
   * @throws Construction_error as same_storage_fast_stack does.
   */
  template<typename T>
  Compressed_matrix<T>
  vstack(Matrix_list<T> const& mats)
  {
    return stack_details::oriented_stack(mats, Storage::row_major, "vstack");
  }

  /**
   * @brief Stack matrices with the same number of rows side by side. The
   * result is column-major.
   *
   * @throws Construction_error as same_storage_fast_stack does.
   */
  template<typename T>
  Compressed_matrix<T>
  hstack(Matrix_list<T> const& mats)
  {
    return stack_details::oriented_stack(mats, Storage::column_major, "hstack");
  }

  /**
   * @brief Assemble a matrix from a grid of blocks.
   *
   * Absent cells are zero blocks. Their height is the largest height of
   * the present blocks in their block row and their width the largest
   * width of the present blocks in their block column. Each block row is
   * stacked horizontally, then the block rows are stacked vertically, so
   * the result is row-major.
   *
   * @throws Construction_error with kind
   *   - empty_stacking_list if there are no block rows or the first block
   *     row is empty,
   *   - incompatible_dimensions if the block rows differ in length, or if
   *     a present block does not match the shape of its block row or
   *     block column,
   *   - empty_bmat_row if a block row has no present block,
   *   - empty_bmat_col if a block column has no present block.
   */
  template<typename T>
  Compressed_matrix<T>
  bmat(Block_grid<T> const& grid)
  {
    using Kind = Construction_error::Kind;

    auto super_rows = grid.size();
    if (super_rows == 0) {
      throw Construction_error(Kind::empty_stacking_list, "no block rows");
    }
    auto super_cols = grid.front().size();
    if (super_cols == 0) {
      throw Construction_error(Kind::empty_stacking_list, "no block columns");
    }

    for (std::size_t i = 0; i < super_rows; ++i) {
      if (grid[i].size() != super_cols) {
        throw Construction_error(
          Kind::incompatible_dimensions,
          "block row " + std::to_string(i) + " has "
          + std::to_string(grid[i].size()) + " blocks, expected "
          + std::to_string(super_cols));
      }
    }

    for (std::size_t i = 0; i < super_rows; ++i) {
      auto absent = std::none_of(
        grid[i].begin(), grid[i].end(),
        [](Block<T> const& block) { return block.has_value(); });
      if (absent) {
        throw Construction_error(
          Kind::empty_bmat_row, "block row " + std::to_string(i));
      }
    }

    for (std::size_t j = 0; j < super_cols; ++j) {
      auto absent = std::none_of(
        grid.begin(), grid.end(),
        [j](std::vector<Block<T>> const& row) { return row[j].has_value(); });
      if (absent) {
        throw Construction_error(
          Kind::empty_bmat_col, "block column " + std::to_string(j));
      }
    }

    // Shapes of the zero blocks
    std::vector<config::size_type> rows_per_row(super_rows, 0);
    std::vector<config::size_type> cols_per_col(super_cols, 0);
    for (std::size_t i = 0; i < super_rows; ++i) {
      for (std::size_t j = 0; j < super_cols; ++j) {
        if (auto const& block = grid[i][j]) {
          Compressed_matrix<T> const& mat = *block;
          rows_per_row[i] = std::max(rows_per_row[i], mat.rows());
          cols_per_col[j] = std::max(cols_per_col[j], mat.columns());
        }
      }
    }

    logger()->debug(
      "bmat: {}x{} blocks, block heights {}, block widths {}",
      super_rows, super_cols, rows_per_row, cols_per_col);

    std::vector<Compressed_matrix<T>> bands;
    bands.reserve(super_rows);
    for (std::size_t i = 0; i < super_rows; ++i) {
      std::vector<Compressed_matrix<T>> zeros;
      zeros.reserve(super_cols);

      Matrix_list<T> with_zeros;
      with_zeros.reserve(super_cols);
      for (std::size_t j = 0; j < super_cols; ++j) {
        if (auto const& block = grid[i][j]) {
          with_zeros.push_back(*block);
        } else {
          zeros.push_back(Compressed_matrix<T>::zero(
            Shape{rows_per_row[i], cols_per_col[j]}));
          with_zeros.push_back(std::cref(zeros.back()));
        }
      }
      bands.push_back(hstack(with_zeros));
    }

    Matrix_list<T> to_vstack(bands.begin(), bands.end());
    return vstack(to_vstack);
  }

} // end of namespace sparcon::data::detail
