#pragma once

//
// ... Standard header files
//
#include <algorithm>
#include <complex>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <istream>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>

//
// ... sparcon header files
//
#include <sparcon/config.hpp>
#include <sparcon/data/Compressed_matrix.hpp>
#include <sparcon/data/Coordinate_matrix.hpp>
#include <sparcon/data/Entry.hpp>
#include <sparcon/data/numeric_kind.hpp>
#include <sparcon/logging.hpp>

namespace sparcon::data::detail {

  /**
   * @brief Raised when a Matrix Market stream cannot be read or written.
   */
  class Matrix_market_error final : public std::runtime_error {
  public:
    enum class Kind {
      io,                ///< The file could not be opened or the stream failed.
      bad_file,          ///< The content does not follow the format.
      unsupported_format ///< Valid banner, but a field or symmetry not handled.
    };

    Matrix_market_error(Kind kind, std::string const& detail);

    Kind
    kind() const;

  private:
    Kind kind_;

  }; // end of class Matrix_market_error

  struct Matrix_market_banner {
    enum class Format { coordinate, array };
    enum class Field { real, integer, complex, pattern };
    enum class Symmetry { general, symmetric, skew_symmetric, hermitian };

    Format format;
    Field field;
    Symmetry symmetry;
  };

  /**
   * @brief Parse the first line of a Matrix Market file. Words are case
   * insensitive.
   *
   * @throws Matrix_market_error (bad_file) if the line is not a matrix
   *         banner or names an unknown format, field or symmetry.
   */
  Matrix_market_banner
  parse_banner(std::string const& line);

  std::string
  format_banner(Matrix_market_banner const& banner);

  namespace matrix_market_details {

    struct Size_line {
      config::size_type rows;
      config::size_type cols;
      config::size_type entries;
    };

    /// Upper bound on the entries reserved ahead of reading; the count in
    /// the size line is not trusted for allocation.
    inline constexpr config::size_type max_reserved_entries = 1 << 20;

    struct Entry_line {
      config::size_type row;
      config::size_type col;
      long long integer;
      double real;
    };

    /// @throws Matrix_market_error unless @p banner is coordinate general
    ///         with a real or integer field.
    void
    check_readable(Matrix_market_banner const& banner);

    /// @throws Matrix_market_error (bad_file) unless the line holds exactly
    ///         three non-negative integers.
    Size_line
    parse_size_line(std::string const& line);

    /// @brief Parse "row col value" with 1-based indices, returned 0-based.
    /// @throws Matrix_market_error (bad_file) on any malformed line.
    Entry_line
    parse_entry_line(
      std::string const& line,
      Matrix_market_banner::Field field,
      Size_line const& size);

    bool
    is_blank(std::string const& line);

    void
    write_header(
      std::ostream& os, Numeric_kind kind, Shape shape, config::size_type nnz);

    template<typename T>
    void
    write_value(std::ostream& os, T const& value)
    {
      if constexpr (is_complex<T>::value) {
        os << value.real() << ' ' << value.imag();
      } else {
        os << value;
      }
    }

    template<typename T>
    int
    round_trip_precision()
    {
      if constexpr (is_complex<T>::value) {
        return std::numeric_limits<typename T::value_type>::max_digits10;
      } else if constexpr (std::is_floating_point_v<T>) {
        return std::numeric_limits<T>::max_digits10;
      } else {
        return 0;
      }
    }

    /// @brief Restores the precision of a stream on scope exit.
    class Precision_guard final {
    public:
      Precision_guard(std::ostream& os, int precision);
      ~Precision_guard();

      Precision_guard(Precision_guard const&) = delete;
      Precision_guard&
      operator=(Precision_guard const&) = delete;

    private:
      std::ostream& os_;
      std::streamsize saved_;
    };

    void
    check_stream(std::ostream& os);

  } // end of namespace matrix_market_details

  // -- Read --

  /**
   * @brief Read a general coordinate matrix with a real or integer field.
   *
   * Comment and blank lines may precede the size line; blank lines may
   * separate the entries. Indices are converted from 1-based to 0-based.
   *
   * @throws Matrix_market_error
   */
  template <typename T>
  Coordinate_matrix<T>
  read_matrix_market(std::istream& is) {
    using namespace matrix_market_details;
    using Kind = Matrix_market_error::Kind;

    std::string line;
    if (!std::getline(is, line)) {
      throw Matrix_market_error(Kind::bad_file, "unexpected end of input");
    }

    auto banner = parse_banner(line);
    check_readable(banner);

    bool found = false;
    while (std::getline(is, line)) {
      if (!is_blank(line) && line[0] != '%') {
        found = true;
        break;
      }
    }
    if (!found) {
      throw Matrix_market_error(Kind::bad_file, "missing size line");
    }

    auto size = parse_size_line(line);

    Coordinate_matrix<T> result{Shape{size.rows, size.cols}};
    result.reserve(std::min(size.entries, max_reserved_entries));

    for (config::size_type k = 0; k < size.entries; ++k) {
      found = false;
      while (std::getline(is, line)) {
        if (!is_blank(line)) {
          found = true;
          break;
        }
      }
      if (!found) {
        throw Matrix_market_error(
          Kind::bad_file,
          "expected " + std::to_string(size.entries) + " entries, found "
          + std::to_string(k));
      }

      auto entry = parse_entry_line(line, banner.field, size);
      auto value = banner.field == Matrix_market_banner::Field::integer
        ? static_cast<T>(entry.integer)
        : static_cast<T>(entry.real);
      result.add(Index{entry.row, entry.col}, value);
    }

    logger()->debug(
      "read_matrix_market: {}x{} matrix with {} entries",
      size.rows, size.cols, size.entries);

    return result;
  }

  template <typename T>
  Coordinate_matrix<T>
  read_matrix_market(std::filesystem::path const& path) {
    std::ifstream file{path};
    if (!file) {
      throw Matrix_market_error(
        Matrix_market_error::Kind::io, "cannot open file: " + path.string());
    }
    logger()->debug("read_matrix_market: reading {}", path.string());
    return read_matrix_market<T>(file);
  }

  // -- Write --

  /**
   * @brief Write @p A as a general coordinate matrix, one line per entry
   * in stored order, with 1-based indices.
   *
   * @throws Matrix_market_error (io) if the stream fails.
   */
  template <typename T>
  void
  write_matrix_market(std::ostream& os, Coordinate_matrix<T> const& A) {
    using namespace matrix_market_details;

    write_header(os, numeric_kind<T>(), A.shape(), A.size());

    Precision_guard guard{os, round_trip_precision<T>()};
    for (auto const& entry : A.entries()) {
      os << (entry.index.row() + 1) << ' ' << (entry.index.column() + 1) << ' ';
      write_value(os, entry.value);
      os << '\n';
    }
    check_stream(os);
  }

  /**
   * @brief Write @p A as a general coordinate matrix, walking its outer
   * slots in order, with 1-based indices.
   *
   * @throws Matrix_market_error (io) if the stream fails.
   */
  template <typename T>
  void
  write_matrix_market(std::ostream& os, Compressed_matrix<T> const& A) {
    using namespace matrix_market_details;
    using size_type = config::size_type;

    write_header(os, numeric_kind<T>(), A.shape(), A.size());

    auto op = A.outer_ptr();
    auto ii = A.inner_ind();
    auto vals = A.values();

    Precision_guard guard{os, round_trip_precision<T>()};
    for (size_type k = 0; k < A.outer_dim(); ++k) {
      for (auto p = op[k]; p < op[k + 1]; ++p) {
        auto row = A.is_row_major() ? k : ii[p];
        auto col = A.is_row_major() ? ii[p] : k;
        os << (row + 1) << ' ' << (col + 1) << ' ';
        write_value(os, vals[p]);
        os << '\n';
      }
    }
    check_stream(os);
  }

  template <typename Matrix>
  void
  write_matrix_market(std::filesystem::path const& path, Matrix const& A) {
    std::ofstream file{path};
    if (!file) {
      throw Matrix_market_error(
        Matrix_market_error::Kind::io, "cannot open file: " + path.string());
    }
    logger()->debug("write_matrix_market: writing {}", path.string());
    write_matrix_market(file, A);
  }

} // end of namespace sparcon::data::detail
