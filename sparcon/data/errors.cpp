#include <sparcon/data/errors.hpp>

namespace sparcon::data::detail {

  Construction_error::Construction_error(Kind kind, std::string const& detail)
    : std::invalid_argument(to_string(kind) + ": " + detail)
    , kind_(kind)
  {}

  Construction_error::Kind
  Construction_error::kind() const { return kind_; }

  std::string
  to_string(Construction_error::Kind kind)
  {
    using Kind = Construction_error::Kind;
    switch (kind) {
    case Kind::empty_stacking_list: return "empty stacking list";
    case Kind::incompatible_dimensions: return "incompatible dimensions";
    case Kind::incompatible_storages: return "incompatible storages";
    case Kind::empty_bmat_row: return "empty block row";
    case Kind::empty_bmat_col: return "empty block column";
    }
    return "unknown construction error";
  }

} // end of namespace sparcon::data::detail
