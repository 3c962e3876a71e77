#include <sparcon/data/Index.hpp>

namespace sparcon::data::detail{

  Index::Index(size_type row, size_type column)
      : row_(row)
      , column_(column)
    {
      if (row_ < 0 || column_ < 0) {
        throw invalid_argument("invalid matrix index");
      }
    }

  config::size_type
  Index::row() const { return row_; }

  config::size_type
  Index::column() const { return column_; }

  bool
  operator==(const Index& index1, const Index& index2){
    return index1.row_ == index2.row_ && index1.column_ == index2.column_;
  }

} // end of namespace sparcon::data::detail
