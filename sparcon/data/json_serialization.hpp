#pragma once

//
// ... Standard header files
//
#include <vector>

//
// ... External header files
//
#include <nlohmann/json.hpp>

//
// ... sparcon header files
//
#include <sparcon/config.hpp>
#include <sparcon/data/Compressed_matrix.hpp>
#include <sparcon/data/Index.hpp>
#include <sparcon/data/Shape.hpp>
#include <sparcon/data/Storage.hpp>

// Index has no default constructor, so get<Index>() needs an
// adl_serializer specialization.

namespace nlohmann {

  template <>
  struct adl_serializer<sparcon::data::detail::Index> {
    static sparcon::data::detail::Index
    from_json(json const& j) {
      return sparcon::data::detail::Index{
          j.at(0).get<sparcon::config::size_type>(),
          j.at(1).get<sparcon::config::size_type>()};
    }

    static void
    to_json(json& j, sparcon::data::detail::Index const& idx) {
      j = {idx.row(), idx.column()};
    }
  };

} // end of namespace nlohmann

namespace sparcon::data::detail {

  // -- Compressed_matrix<T> --

  template <typename T>
  nlohmann::json
  compressed_matrix_to_json(Compressed_matrix<T> const& mat) {
    nlohmann::json j;
    j["storage"] = mat.storage();
    j["shape"] = mat.shape();

    auto op = mat.outer_ptr();
    j["outer_ptr"] = std::vector<config::size_type>(op.begin(), op.end());

    auto ii = mat.inner_ind();
    j["inner_ind"] = std::vector<config::size_type>(ii.begin(), ii.end());

    auto sv = mat.values();
    j["values"] = std::vector<T>(sv.begin(), sv.end());

    return j;
  }

  /// @throws Structure_error if the arrays are not a valid compressed matrix.
  template <typename T>
  Compressed_matrix<T>
  compressed_matrix_from_json(nlohmann::json const& j) {
    return Compressed_matrix<T>{
      j.at("storage").get<Storage>(),
      j.at("shape").get<Shape>(),
      j.at("outer_ptr").get<std::vector<config::size_type>>(),
      j.at("inner_ind").get<std::vector<config::size_type>>(),
      j.at("values").get<std::vector<T>>()};
  }

} // end of namespace sparcon::data::detail
