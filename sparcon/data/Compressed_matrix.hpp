#pragma once

//
// ... Standard header files
//
#include <algorithm>
#include <iterator>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

//
// ... sparcon header files
//
#include <sparcon/config.hpp>
#include <sparcon/data/Compressed_structure.hpp>
#include <sparcon/data/Shape.hpp>
#include <sparcon/data/Sparse_vector.hpp>
#include <sparcon/data/Storage.hpp>

namespace sparcon::data::detail {

  /**
   * @brief Compressed sparse matrix in either row-major (CSR) or
   * column-major (CSC) orientation.
   *
   * The matrix owns three arrays: an outer pointer with one entry per outer
   * slot plus one, the inner indices of the stored entries and their
   * values. The inner indices of each outer slot are strictly increasing.
   *
   * Apart from append_outer, which grows the matrix by one outer slot while
   * it is being assembled, a Compressed_matrix is a value: copies are deep
   * and the construction routines always return freshly allocated
   * matrices.
   */
  template<typename T = config::value_type>
  class Compressed_matrix final
  {
  public:
    using size_type = config::size_type;
    using value_type = T;

    /**
     * @brief Construct from raw compressed arrays.
     *
     * @throws Structure_error if the arrays do not describe a valid
     *         compressed matrix of @p shape in @p storage orientation.
     */
    Compressed_matrix(
      Storage storage,
      Shape shape,
      std::vector<size_type> outer_ptr,
      std::vector<size_type> inner_ind,
      std::vector<T> values)
      : storage_(storage)
      , shape_(shape)
      , outer_ptr_(std::move(outer_ptr))
      , inner_ind_(std::move(inner_ind))
      , values_(std::move(values))
    {
      check_compressed_structure(
        storage_, shape_, outer_ptr_, inner_ind_,
        static_cast<size_type>(values_.size()));
    }

    /**
     * @brief A matrix with no outer slots and the given inner dimension,
     * ready to be grown with append_outer.
     */
    static Compressed_matrix
    empty(Storage storage, size_type inner_dim)
    {
      auto shape = storage == Storage::row_major
        ? Shape{0, inner_dim}
        : Shape{inner_dim, 0};
      return Compressed_matrix{storage, shape, {0}, {}, {}, Unchecked{}};
    }

    /// @brief A row-major matrix of @p shape without stored entries.
    static Compressed_matrix
    zero(Shape shape)
    {
      return Compressed_matrix{
        Storage::row_major, shape,
        std::vector<size_type>(static_cast<std::size_t>(shape.row() + 1), 0),
        {}, {}, Unchecked{}};
    }

    static Compressed_matrix
    identity(Storage storage, size_type n)
    {
      std::vector<size_type> outer_ptr(static_cast<std::size_t>(n + 1));
      std::vector<size_type> inner_ind(static_cast<std::size_t>(n));
      for (size_type i = 0; i <= n; ++i) {
        outer_ptr[static_cast<std::size_t>(i)] = i;
      }
      for (size_type i = 0; i < n; ++i) {
        inner_ind[static_cast<std::size_t>(i)] = i;
      }
      return Compressed_matrix{
        storage, Shape{n, n}, std::move(outer_ptr), std::move(inner_ind),
        std::vector<T>(static_cast<std::size_t>(n), T{1}), Unchecked{}};
    }

    Storage
    storage() const
    {
      return storage_;
    }

    bool
    is_row_major() const
    {
      return storage_ == Storage::row_major;
    }

    bool
    is_column_major() const
    {
      return storage_ == Storage::column_major;
    }

    Shape
    shape() const
    {
      return shape_;
    }

    size_type
    rows() const
    {
      return shape_.row();
    }

    size_type
    columns() const
    {
      return shape_.column();
    }

    size_type
    outer_dim() const
    {
      return detail::outer_dim(storage_, shape_);
    }

    size_type
    inner_dim() const
    {
      return detail::inner_dim(storage_, shape_);
    }

    /// @brief Return the number of stored entries.
    size_type
    size() const
    {
      return static_cast<size_type>(inner_ind_.size());
    }

    std::span<size_type const>
    outer_ptr() const
    {
      return outer_ptr_;
    }

    std::span<size_type const>
    inner_ind() const
    {
      return inner_ind_;
    }

    std::span<T const>
    values() const
    {
      return {values_.data(), values_.size()};
    }

    /**
     * @brief Borrow outer slot @p k (a row for row-major storage, a column
     * for column-major storage).
     */
    Sparse_vector_view<T>
    outer_vector(size_type k) const
    {
      auto first = static_cast<std::size_t>(outer_ptr_[static_cast<std::size_t>(k)]);
      auto last = static_cast<std::size_t>(outer_ptr_[static_cast<std::size_t>(k + 1)]);
      return Sparse_vector_view<T>{
        inner_dim(),
        std::span<size_type const>{inner_ind_}.subspan(first, last - first),
        std::span<T const>{values_}.subspan(first, last - first)};
    }

    /// @brief Make room for @p n more outer slots.
    void
    reserve_outer_exact(size_type n)
    {
      outer_ptr_.reserve(outer_ptr_.size() + static_cast<std::size_t>(n));
    }

    /// @brief Make room for @p n more stored entries.
    void
    reserve_nnz_exact(size_type n)
    {
      inner_ind_.reserve(inner_ind_.size() + static_cast<std::size_t>(n));
      values_.reserve(values_.size() + static_cast<std::size_t>(n));
    }

    /**
     * @brief Append one outer slot holding the entries of @p vec.
     *
     * The indices of @p vec are trusted to be sorted and in range; they
     * come from another compressed matrix of the same inner dimension.
     *
     * @throws std::invalid_argument if @p vec has a different dimension.
     */
    void
    append_outer(Sparse_vector_view<T> const& vec)
    {
      if (vec.dim != inner_dim()) {
        throw std::invalid_argument(
          "append_outer: vector of dimension " + std::to_string(vec.dim)
          + " appended to matrix of inner dimension "
          + std::to_string(inner_dim()));
      }
      inner_ind_.insert(inner_ind_.end(), vec.indices.begin(), vec.indices.end());
      values_.insert(values_.end(), vec.values.begin(), vec.values.end());
      outer_ptr_.push_back(static_cast<size_type>(inner_ind_.size()));
      shape_ = is_row_major()
        ? Shape{shape_.row() + 1, shape_.column()}
        : Shape{shape_.row(), shape_.column() + 1};
    }

    /// @brief Return the value at (@p row, @p col), zero if not stored.
    T
    operator()(size_type row, size_type col) const
    {
      auto outer = is_row_major() ? row : col;
      auto inner = is_row_major() ? col : row;
      auto begin = inner_ind_.begin() + outer_ptr_[static_cast<std::size_t>(outer)];
      auto end = inner_ind_.begin() + outer_ptr_[static_cast<std::size_t>(outer + 1)];
      auto it = std::lower_bound(begin, end, inner);
      if (it != end && *it == inner) {
        return values_[static_cast<std::size_t>(std::distance(inner_ind_.begin(), it))];
      }
      return T{0};
    }

    friend bool
    operator==(Compressed_matrix const& a, Compressed_matrix const& b)
    {
      return a.storage_ == b.storage_
        && a.shape_ == b.shape_
        && a.outer_ptr_ == b.outer_ptr_
        && a.inner_ind_ == b.inner_ind_
        && a.values_ == b.values_;
    }

    template<typename U>
    friend Compressed_matrix<U>
    transpose(Compressed_matrix<U> mat);

  private:
    struct Unchecked {};

    Compressed_matrix(
      Storage storage,
      Shape shape,
      std::vector<size_type> outer_ptr,
      std::vector<size_type> inner_ind,
      std::vector<T> values,
      Unchecked)
      : storage_(storage)
      , shape_(shape)
      , outer_ptr_(std::move(outer_ptr))
      , inner_ind_(std::move(inner_ind))
      , values_(std::move(values))
    {}

    Storage storage_;
    Shape shape_;
    std::vector<size_type> outer_ptr_;
    std::vector<size_type> inner_ind_;
    std::vector<T> values_;

  }; // end of class Compressed_matrix

  /**
   * @brief Transpose by reinterpretation.
   *
   * The arrays of a CSR matrix read as CSC describe its transpose, so only
   * the orientation tag and the shape change. Pass an rvalue to avoid
   * copying the arrays.
   */
  template<typename U>
  Compressed_matrix<U>
  transpose(Compressed_matrix<U> mat)
  {
    mat.storage_ = other_storage(mat.storage_);
    mat.shape_ = mat.shape_.transposed();
    return mat;
  }

} // end of namespace sparcon::data::detail
