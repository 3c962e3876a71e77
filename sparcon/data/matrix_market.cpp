//
// ... Standard header files
//
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

//
// ... sparcon header files
//
#include <sparcon/data/matrix_market.hpp>

namespace sparcon::data::detail {

  namespace {

    using Kind = Matrix_market_error::Kind;

    std::string
    to_lower(std::string s)
    {
      std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      return s;
    }

    std::vector<std::string>
    split(std::string const& line)
    {
      std::istringstream iss{line};
      std::vector<std::string> words;
      std::string word;
      while (iss >> word) { words.push_back(word); }
      return words;
    }

    [[noreturn]] void
    reject(Kind kind, std::string const& detail)
    {
      logger()->debug("matrix market: rejected input: {}", detail);
      throw Matrix_market_error(kind, detail);
    }

    // Digits only, so signs and fractions are refused.
    config::size_type
    parse_count(std::string const& word, std::string const& what)
    {
      if (word.empty()
          || !std::all_of(word.begin(), word.end(),
                          [](unsigned char c) { return std::isdigit(c); })) {
        reject(Kind::bad_file, "invalid " + what + ": " + word);
      }
      errno = 0;
      auto value = std::strtoll(word.c_str(), nullptr, 10);
      if (errno == ERANGE) {
        reject(Kind::bad_file, what + " out of range: " + word);
      }
      return static_cast<config::size_type>(value);
    }

    long long
    parse_integer(std::string const& word)
    {
      char* end = nullptr;
      errno = 0;
      auto value = std::strtoll(word.c_str(), &end, 10);
      if (end != word.c_str() + word.size() || errno == ERANGE) {
        reject(Kind::bad_file, "invalid integer value: " + word);
      }
      return value;
    }

    double
    parse_real(std::string const& word)
    {
      char* end = nullptr;
      errno = 0;
      auto value = std::strtod(word.c_str(), &end);
      if (end != word.c_str() + word.size() || errno == ERANGE) {
        reject(Kind::bad_file, "invalid real value: " + word);
      }
      return value;
    }

    std::string
    describe(Kind kind)
    {
      switch (kind) {
      case Kind::io: return "matrix market: i/o error: ";
      case Kind::bad_file: return "matrix market: bad file: ";
      case Kind::unsupported_format: return "matrix market: unsupported format: ";
      }
      return "matrix market: ";
    }

  } // end of anonymous namespace

  Matrix_market_error::Matrix_market_error(Kind kind, std::string const& detail)
    : std::runtime_error(describe(kind) + detail)
    , kind_(kind)
  {}

  Matrix_market_error::Kind
  Matrix_market_error::kind() const { return kind_; }

  Matrix_market_banner
  parse_banner(std::string const& line)
  {
    auto words = split(line);
    if (words.size() != 5) {
      reject(Kind::bad_file, "invalid banner: " + line);
    }

    auto header = to_lower(words[0]);
    auto object = to_lower(words[1]);
    auto format_str = to_lower(words[2]);
    auto field_str = to_lower(words[3]);
    auto symmetry_str = to_lower(words[4]);

    if (header != "%%matrixmarket") {
      reject(Kind::bad_file, "invalid banner header: " + words[0]);
    }
    if (object != "matrix") {
      reject(Kind::bad_file, "unknown object: " + words[1]);
    }

    Matrix_market_banner banner{};

    if (format_str == "coordinate") {
      banner.format = Matrix_market_banner::Format::coordinate;
    } else if (format_str == "array") {
      banner.format = Matrix_market_banner::Format::array;
    } else {
      reject(Kind::bad_file, "unknown format: " + format_str);
    }

    if (field_str == "real") {
      banner.field = Matrix_market_banner::Field::real;
    } else if (field_str == "integer") {
      banner.field = Matrix_market_banner::Field::integer;
    } else if (field_str == "complex") {
      banner.field = Matrix_market_banner::Field::complex;
    } else if (field_str == "pattern") {
      banner.field = Matrix_market_banner::Field::pattern;
    } else {
      reject(Kind::bad_file, "unknown field: " + field_str);
    }

    if (symmetry_str == "general") {
      banner.symmetry = Matrix_market_banner::Symmetry::general;
    } else if (symmetry_str == "symmetric") {
      banner.symmetry = Matrix_market_banner::Symmetry::symmetric;
    } else if (symmetry_str == "skew-symmetric") {
      banner.symmetry = Matrix_market_banner::Symmetry::skew_symmetric;
    } else if (symmetry_str == "hermitian") {
      banner.symmetry = Matrix_market_banner::Symmetry::hermitian;
    } else {
      reject(Kind::bad_file, "unknown symmetry: " + symmetry_str);
    }

    return banner;
  }

  std::string
  format_banner(Matrix_market_banner const& banner)
  {
    std::string result = "%%MatrixMarket matrix";

    switch (banner.format) {
    case Matrix_market_banner::Format::coordinate:
      result += " coordinate"; break;
    case Matrix_market_banner::Format::array:
      result += " array"; break;
    }

    switch (banner.field) {
    case Matrix_market_banner::Field::real:
      result += " real"; break;
    case Matrix_market_banner::Field::integer:
      result += " integer"; break;
    case Matrix_market_banner::Field::complex:
      result += " complex"; break;
    case Matrix_market_banner::Field::pattern:
      result += " pattern"; break;
    }

    switch (banner.symmetry) {
    case Matrix_market_banner::Symmetry::general:
      result += " general"; break;
    case Matrix_market_banner::Symmetry::symmetric:
      result += " symmetric"; break;
    case Matrix_market_banner::Symmetry::skew_symmetric:
      result += " skew-symmetric"; break;
    case Matrix_market_banner::Symmetry::hermitian:
      result += " hermitian"; break;
    }

    return result;
  }

  namespace matrix_market_details {

    void
    check_readable(Matrix_market_banner const& banner)
    {
      if (banner.format != Matrix_market_banner::Format::coordinate) {
        reject(Kind::bad_file, "only the coordinate format can be read");
      }
      if (banner.field != Matrix_market_banner::Field::real
          && banner.field != Matrix_market_banner::Field::integer) {
        reject(Kind::unsupported_format, "only real and integer fields are read");
      }
      if (banner.symmetry != Matrix_market_banner::Symmetry::general) {
        reject(Kind::unsupported_format, "only general matrices are read");
      }
    }

    Size_line
    parse_size_line(std::string const& line)
    {
      auto words = split(line);
      if (words.size() != 3) {
        reject(Kind::bad_file, "invalid size line: " + line);
      }
      return Size_line{
        parse_count(words[0], "row count"),
        parse_count(words[1], "column count"),
        parse_count(words[2], "entry count")};
    }

    Entry_line
    parse_entry_line(
      std::string const& line,
      Matrix_market_banner::Field field,
      Size_line const& size)
    {
      auto words = split(line);
      if (words.size() != 3) {
        reject(Kind::bad_file, "entry line needs 3 fields: " + line);
      }

      auto row = parse_count(words[0], "row index");
      auto col = parse_count(words[1], "column index");
      if (row < 1 || row > size.rows || col < 1 || col > size.cols) {
        reject(Kind::bad_file, "entry index out of range: " + line);
      }

      Entry_line entry{row - 1, col - 1, 0, 0.0};
      if (field == Matrix_market_banner::Field::integer) {
        entry.integer = parse_integer(words[2]);
      } else {
        entry.real = parse_real(words[2]);
      }
      return entry;
    }

    bool
    is_blank(std::string const& line)
    {
      return std::all_of(line.begin(), line.end(),
        [](unsigned char c) { return std::isspace(c); });
    }

    void
    write_header(
      std::ostream& os, Numeric_kind kind, Shape shape, config::size_type nnz)
    {
      Matrix_market_banner banner{
        Matrix_market_banner::Format::coordinate,
        Matrix_market_banner::Field::real,
        Matrix_market_banner::Symmetry::general};

      switch (kind) {
      case Numeric_kind::integer:
        banner.field = Matrix_market_banner::Field::integer; break;
      case Numeric_kind::floating:
        banner.field = Matrix_market_banner::Field::real; break;
      case Numeric_kind::complex:
        banner.field = Matrix_market_banner::Field::complex; break;
      }

      os << format_banner(banner) << '\n'
         << "% written by " << config::logger_name << '\n'
         << shape.row() << ' ' << shape.column() << ' ' << nnz << '\n';

      logger()->debug(
        "write_matrix_market: {}x{} matrix with {} entries",
        shape.row(), shape.column(), nnz);
    }

    Precision_guard::Precision_guard(std::ostream& os, int precision)
      : os_(os)
      , saved_(os.precision())
    {
      if (precision > 0) { os_.precision(precision); }
    }

    Precision_guard::~Precision_guard()
    {
      os_.precision(saved_);
    }

    void
    check_stream(std::ostream& os)
    {
      os.flush();
      if (!os) {
        reject(Kind::io, "write failed");
      }
    }

  } // end of namespace matrix_market_details

} // end of namespace sparcon::data::detail
