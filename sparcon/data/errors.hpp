#pragma once

//
// ... Standard header files
//
#include <stdexcept>
#include <string>

namespace sparcon::data::detail {

  /**
   * @brief Raised when matrices cannot be stacked or assembled into blocks.
   *
   * The kind identifies which structural requirement failed; the message
   * carries the offending detail.
   */
  class Construction_error final : public std::invalid_argument {
  public:
    enum class Kind {
      empty_stacking_list,
      incompatible_dimensions,
      incompatible_storages,
      empty_bmat_row,
      empty_bmat_col
    };

    Construction_error(Kind kind, std::string const& detail);

    Kind
    kind() const;

  private:
    Kind kind_;

  }; // end of class Construction_error

  std::string
  to_string(Construction_error::Kind kind);

  /**
   * @brief Raised when raw compressed arrays do not describe a valid
   * compressed matrix.
   */
  class Structure_error final : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;

  }; // end of class Structure_error

} // end of namespace sparcon::data::detail
