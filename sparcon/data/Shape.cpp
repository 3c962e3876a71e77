#include <sparcon/data/Shape.hpp>


namespace sparcon::data::detail
{

  Shape::Shape(size_type row, size_type column)
      : row_(row)
      , column_(column)
    {
      if (row_ < 0 || column_ < 0) {
        throw invalid_argument("invalid matrix shape");
      }
    }

  config::size_type
  Shape::row() const { return row_; }

  config::size_type
  Shape::column() const { return column_; }

  Shape
  Shape::transposed() const { return Shape{column_, row_}; }

  bool
  operator==(const Shape& shape1, const Shape& shape2){
    return shape1.row_ == shape2.row_ && shape1.column_ == shape2.column_;
  }

  void
  to_json(json& j, Shape const& shape)
  {
    j = {shape.row(), shape.column()};
  }

  void
  from_json(const json& j, Shape& shape){
    shape = Shape(j.at(0).get<config::size_type>(),
                  j.at(1).get<config::size_type>());
  }

} // end of namespace sparcon::data::detail
