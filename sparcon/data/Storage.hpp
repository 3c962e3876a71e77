#pragma once

//
// ... Standard header files
//
#include <string>

//
// ... sparcon header files
//
#include <sparcon/data/import.hpp>

namespace sparcon::data::detail {

  /**
   * @brief Orientation of a compressed matrix.
   *
   * With @c row_major storage the outer dimension is the row axis and the
   * inner dimension the column axis (CSR); @c column_major reverses the
   * roles (CSC).
   */
  enum class Storage { row_major, column_major };

  /// @brief Return the orientation that is not @p storage.
  Storage
  other_storage(Storage storage);

  std::string
  to_string(Storage storage);

  NLOHMANN_JSON_SERIALIZE_ENUM(Storage, {
    {Storage::row_major, "row_major"},
    {Storage::column_major, "column_major"},
  })

} // end of namespace sparcon::data::detail
