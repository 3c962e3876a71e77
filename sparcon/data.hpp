#pragma once

//
// ... sparcon header files
//
#include <sparcon/data/Compressed_matrix.hpp>
#include <sparcon/data/Coordinate_matrix.hpp>
#include <sparcon/data/Dense_view.hpp>
#include <sparcon/data/Entry.hpp>
#include <sparcon/data/Shape.hpp>
#include <sparcon/data/Storage.hpp>
#include <sparcon/data/construct.hpp>
#include <sparcon/data/conversions.hpp>
#include <sparcon/data/dense.hpp>
#include <sparcon/data/errors.hpp>
#include <sparcon/data/matrix_market.hpp>

namespace sparcon::data {
  using ::sparcon::data::detail::Entry;
  using ::sparcon::data::detail::Index;
  using ::sparcon::data::detail::Shape;
  using ::sparcon::data::detail::Storage;

  using ::sparcon::data::detail::Compressed_matrix;
  using ::sparcon::data::detail::Coordinate_matrix;
  using ::sparcon::data::detail::Dense_view;

  using ::sparcon::data::detail::Block;
  using ::sparcon::data::detail::Block_grid;
  using ::sparcon::data::detail::Matrix_list;

  using ::sparcon::data::detail::Construction_error;
  using ::sparcon::data::detail::Matrix_market_error;
  using ::sparcon::data::detail::Structure_error;

  using ::sparcon::data::detail::bmat;
  using ::sparcon::data::detail::compressed_column_from_dense;
  using ::sparcon::data::detail::compressed_row_from_dense;
  using ::sparcon::data::detail::hstack;
  using ::sparcon::data::detail::same_storage_fast_stack;
  using ::sparcon::data::detail::vstack;

  using ::sparcon::data::detail::to_column_major;
  using ::sparcon::data::detail::to_compressed;
  using ::sparcon::data::detail::to_row_major;
  using ::sparcon::data::detail::to_storage;
  using ::sparcon::data::detail::transpose;

  using ::sparcon::data::detail::read_matrix_market;
  using ::sparcon::data::detail::write_matrix_market;

} // end of namespace sparcon::data
