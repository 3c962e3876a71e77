#pragma once

//
// ... Standard header files
//
#include <span>
#include <stdexcept>

//
// ... sparcon header files
//
#include <sparcon/config.hpp>
#include <sparcon/data/Shape.hpp>

namespace sparcon::data::detail {

  /**
   * @brief Read-only, non-owning view of a dense matrix.
   *
   * Element (row, col) lives at data[row * row_stride + col * column_stride].
   * The viewed storage must outlive the view.
   */
  template<typename T = config::value_type>
  class Dense_view final
  {
  public:
    using size_type = config::size_type;

    Dense_view(
      T const* data,
      Shape shape,
      size_type row_stride,
      size_type column_stride)
      : data_(data)
      , shape_(shape)
      , row_stride_(row_stride)
      , column_stride_(column_stride)
    {}

    /**
     * @brief View @p data as a row-major matrix of @p shape.
     *
     * @throws std::invalid_argument if @p data does not hold exactly
     *         rows * columns elements.
     */
    Dense_view(std::span<T const> data, Shape shape)
      : Dense_view(data.data(), shape, shape.column(), 1)
    {
      if (static_cast<size_type>(data.size()) != shape.row() * shape.column()) {
        throw std::invalid_argument("dense view: data size does not match shape");
      }
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

    T const&
    operator()(size_type row, size_type col) const
    {
      return data_[row * row_stride_ + col * column_stride_];
    }

    /// @brief The same data seen with rows and columns exchanged.
    Dense_view
    transposed() const
    {
      return Dense_view{data_, shape_.transposed(), column_stride_, row_stride_};
    }

  private:
    T const* data_;
    Shape shape_;
    size_type row_stride_;
    size_type column_stride_;

  }; // end of class Dense_view

} // end of namespace sparcon::data::detail
