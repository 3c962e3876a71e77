#pragma once

//
// ... sparcon header files
//
#include <sparcon/config.hpp>
#include <sparcon/data/import.hpp>

namespace sparcon::data::detail {

  /**
   * @brief A type describing a matrix shape: the number of rows and columns.
   *
   * Either extent may be zero; empty blocks and empty stacking results are
   * legitimate matrices.
   */
  class Shape final {
  public:
    using size_type = config::size_type;

    Shape(size_type row, size_type column);
    Shape(const Shape& input) = default;
    Shape&
    operator=(const Shape& input) = default;
    Shape(Shape&& input) = default;
    Shape&
    operator=(Shape&& input) = default;
    ~Shape() = default;
    Shape() = default;

    size_type
    row() const;

    size_type
    column() const;

    /// @brief Return the shape with rows and columns exchanged.
    Shape
    transposed() const;

    friend bool
    operator==(const Shape& shape1, const Shape& shape2);

  private:
    size_type row_{};
    size_type column_{};

  }; // end of class Shape

  void
  to_json(json& j, Shape const& shape);

  void
  from_json(const json& j, Shape& shape);

} // namespace sparcon::data::detail
