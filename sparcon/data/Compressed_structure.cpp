#include <sparcon/data/Compressed_structure.hpp>

//
// ... Standard header files
//
#include <string>

//
// ... sparcon header files
//
#include <sparcon/data/errors.hpp>

namespace sparcon::data::detail {

  config::size_type
  outer_dim(Storage storage, Shape shape)
  {
    return storage == Storage::row_major ? shape.row() : shape.column();
  }

  config::size_type
  inner_dim(Storage storage, Shape shape)
  {
    return storage == Storage::row_major ? shape.column() : shape.row();
  }

  void
  check_compressed_structure(
    Storage storage,
    Shape shape,
    std::span<config::size_type const> outer_ptr,
    std::span<config::size_type const> inner_ind,
    config::size_type value_count)
  {
    auto const outer = outer_dim(storage, shape);
    auto const inner = inner_dim(storage, shape);
    auto const nnz = static_cast<config::size_type>(inner_ind.size());

    if (static_cast<config::size_type>(outer_ptr.size()) != outer + 1) {
      throw Structure_error(
        "outer pointer has " + std::to_string(outer_ptr.size())
        + " elements, expected " + std::to_string(outer + 1));
    }
    if (outer_ptr.front() != 0) {
      throw Structure_error("outer pointer does not start at zero");
    }
    if (outer_ptr.back() != nnz) {
      throw Structure_error(
        "outer pointer ends at " + std::to_string(outer_ptr.back())
        + " but there are " + std::to_string(nnz) + " inner indices");
    }
    if (value_count != nnz) {
      throw Structure_error(
        "inner index and value arrays differ in length: "
        + std::to_string(nnz) + " vs " + std::to_string(value_count));
    }

    for (config::size_type k = 0; k < outer; ++k) {
      if (outer_ptr[k + 1] < outer_ptr[k]) {
        throw Structure_error(
          "outer pointer decreases at slot " + std::to_string(k));
      }
    }

    // Monotonic and bounded by nnz from here on.
    for (config::size_type k = 0; k < outer; ++k) {
      auto first = outer_ptr[k];
      auto last = outer_ptr[k + 1];
      for (auto p = first; p < last; ++p) {
        auto i = inner_ind[p];
        if (i < 0 || i >= inner) {
          throw Structure_error(
            "inner index " + std::to_string(i) + " out of range in slot "
            + std::to_string(k));
        }
        if (p > first && inner_ind[p - 1] >= i) {
          throw Structure_error(
            "inner indices not strictly increasing in slot "
            + std::to_string(k));
        }
      }
    }
  }

} // end of namespace sparcon::data::detail
