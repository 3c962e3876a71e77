#pragma once

//
// ... Standard header files
//
#include <complex>
#include <type_traits>

namespace sparcon::data::detail {

  /// @brief Textual family of a matrix element type.
  enum class Numeric_kind { integer, floating, complex };

  template<typename T>
  struct is_complex : std::false_type {};

  template<typename T>
  struct is_complex<std::complex<T>> : std::true_type {};

  template<typename T>
  constexpr Numeric_kind
  numeric_kind()
  {
    if constexpr (is_complex<T>::value) {
      return Numeric_kind::complex;
    } else if constexpr (std::is_integral_v<T>) {
      return Numeric_kind::integer;
    } else {
      static_assert(std::is_floating_point_v<T>,
                    "numeric_kind: unsupported element type");
      return Numeric_kind::floating;
    }
  }

} // end of namespace sparcon::data::detail
