#pragma once

//
// ... sparcon header files
//
#include <sparcon/config.hpp>
#include <sparcon/data/import.hpp>

namespace sparcon::data::detail {

  /**
   * @brief A type describing a matrix index: a row and a column
   */
  class Index final {
  public:
    using size_type = config::size_type;

    Index(size_type row, size_type column);

    size_type
    row() const;

    size_type
    column() const;

    friend bool
    operator==(const Index& index1, const Index& index2);

  private:
    size_type row_{};
    size_type column_{};

  }; // end of class Index

} // namespace sparcon::data::detail
