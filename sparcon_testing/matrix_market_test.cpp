//
// ... Test header files
//
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

//
// ... Standard header files
//
#include <complex>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>

//
// ... sparcon header files
//
#include <sparcon/data/conversions.hpp>
#include <sparcon/data/matrix_market.hpp>

#include "test_matrices.hpp"

namespace sparcon::testing {

  using sparcon::data::detail::Coordinate_matrix;
  using sparcon::data::detail::Entry;
  using sparcon::data::detail::format_banner;
  using sparcon::data::detail::Index;
  using sparcon::data::detail::Matrix_market_banner;
  using sparcon::data::detail::Matrix_market_error;
  using sparcon::data::detail::parse_banner;
  using sparcon::data::detail::read_matrix_market;
  using sparcon::data::detail::to_column_major;
  using sparcon::data::detail::to_compressed;
  using sparcon::data::detail::write_matrix_market;

  using Kind = Matrix_market_error::Kind;

  namespace {

    // Kind of the Matrix_market_error raised while reading @p text, if any.
    std::optional<Kind>
    read_error_kind(std::string const& text)
    {
      std::istringstream iss{text};
      try {
        read_matrix_market<double>(iss);
      } catch (Matrix_market_error const& e) {
        return e.kind();
      }
      return std::nullopt;
    }

    Coordinate_matrix<double>
    read_string(std::string const& text)
    {
      std::istringstream iss{text};
      return read_matrix_market<double>(iss);
    }

    std::string const real_header =
      "%%MatrixMarket matrix coordinate real general\n";

  } // end of anonymous namespace

  // -- Banner --

  TEST_CASE("matrix_market - parse_banner", "[matrix_market]")
  {
    auto banner = parse_banner("%%MatrixMarket matrix coordinate real general");
    CHECK(banner.format == Matrix_market_banner::Format::coordinate);
    CHECK(banner.field == Matrix_market_banner::Field::real);
    CHECK(banner.symmetry == Matrix_market_banner::Symmetry::general);

    auto upper = parse_banner("%%MATRIXMARKET Matrix ARRAY Complex Skew-Symmetric");
    CHECK(upper.format == Matrix_market_banner::Format::array);
    CHECK(upper.field == Matrix_market_banner::Field::complex);
    CHECK(upper.symmetry == Matrix_market_banner::Symmetry::skew_symmetric);
  }

  TEST_CASE("matrix_market - format_banner", "[matrix_market]")
  {
    Matrix_market_banner banner{
      Matrix_market_banner::Format::coordinate,
      Matrix_market_banner::Field::integer,
      Matrix_market_banner::Symmetry::hermitian};
    auto text = format_banner(banner);
    CHECK(text == "%%MatrixMarket matrix coordinate integer hermitian");

    auto parsed = parse_banner(text);
    CHECK(parsed.field == banner.field);
    CHECK(parsed.symmetry == banner.symmetry);
  }

  TEST_CASE("matrix_market - invalid_banner", "[matrix_market]")
  {
    auto kind_of = [](std::string const& line) -> std::optional<Kind> {
      try {
        parse_banner(line);
      } catch (Matrix_market_error const& e) {
        return e.kind();
      }
      return std::nullopt;
    };

    CHECK(kind_of("%%MatrixMarket matrix coordinate real") == Kind::bad_file);
    CHECK(kind_of("%MatrixMarket matrix coordinate real general") == Kind::bad_file);
    CHECK(kind_of("%%MatrixMarket vector coordinate real general") == Kind::bad_file);
    CHECK(kind_of("%%MatrixMarket matrix sparse real general") == Kind::bad_file);
    CHECK(kind_of("%%MatrixMarket matrix coordinate quaternion general") == Kind::bad_file);
    CHECK(kind_of("%%MatrixMarket matrix coordinate real upper") == Kind::bad_file);
    CHECK(kind_of("") == Kind::bad_file);
  }

  // -- Read --

  TEST_CASE("matrix_market - read_real", "[matrix_market]")
  {
    auto coo = read_string(
      real_header
      + "% a comment\n"
      + "\n"
      + "%another comment\n"
      + "3 4 3\n"
      + "1 1 1.5\n"
      + "\n"
      + "3 4 -2\n"
      + "2 2 1e3\n");

    CHECK(coo.shape() == Shape(3, 4));
    REQUIRE(coo.size() == 3);
    CHECK(coo(0, 0) == Catch::Approx(1.5));
    CHECK(coo(2, 3) == Catch::Approx(-2.0));
    CHECK(coo(1, 1) == Catch::Approx(1000.0));

    auto entries = coo.entries();
    CHECK(entries[0].index == Index(0, 0));
    CHECK(entries[1].index == Index(2, 3));
    CHECK(entries[2].index == Index(1, 1));
  }

  TEST_CASE("matrix_market - read_integer", "[matrix_market]")
  {
    std::istringstream iss{
      "%%MatrixMarket matrix coordinate integer general\n"
      "2 2 2\n"
      "1 2 -7\n"
      "2 1 12\n"};
    auto coo = read_matrix_market<int>(iss);

    CHECK(coo.shape() == Shape(2, 2));
    CHECK(coo(0, 1) == -7);
    CHECK(coo(1, 0) == 12);
  }

  TEST_CASE("matrix_market - read_duplicates_are_kept", "[matrix_market]")
  {
    auto coo = read_string(real_header + "2 2 2\n1 1 1\n1 1 2\n");
    CHECK(coo.size() == 2);
    CHECK(coo(0, 0) == Catch::Approx(3.0));

    auto csr = to_compressed(coo, Storage::row_major);
    CHECK(csr.size() == 1);
    CHECK(csr(0, 0) == Catch::Approx(3.0));
  }

  TEST_CASE("matrix_market - read_empty_matrix", "[matrix_market]")
  {
    auto coo = read_string(real_header + "0 0 0\n");
    CHECK(coo.shape() == Shape(0, 0));
    CHECK(coo.size() == 0);
  }

  TEST_CASE("matrix_market - read_bad_file", "[matrix_market]")
  {
    CHECK(read_error_kind("") == Kind::bad_file);
    CHECK(read_error_kind(real_header) == Kind::bad_file);
    CHECK(read_error_kind(real_header + "% only comments\n") == Kind::bad_file);

    // Size line
    CHECK(read_error_kind(real_header + "3 3\n") == Kind::bad_file);
    CHECK(read_error_kind(real_header + "3 3 1 1\n1 1 1\n") == Kind::bad_file);
    CHECK(read_error_kind(real_header + "3 -3 1\n1 1 1\n") == Kind::bad_file);
    CHECK(read_error_kind(real_header + "3 x 1\n1 1 1\n") == Kind::bad_file);

    // Entry lines
    CHECK(read_error_kind(real_header + "3 3 1\n1 1 1 1\n") == Kind::bad_file);
    CHECK(read_error_kind(real_header + "3 3 1\n1 1\n") == Kind::bad_file);
    CHECK(read_error_kind(real_header + "3 3 1\n0 1 1\n") == Kind::bad_file);
    CHECK(read_error_kind(real_header + "3 3 1\n1 4 1\n") == Kind::bad_file);
    CHECK(read_error_kind(real_header + "3 3 1\n4 1 1\n") == Kind::bad_file);
    CHECK(read_error_kind(real_header + "3 3 1\n1 1 abc\n") == Kind::bad_file);
    CHECK(read_error_kind(real_header + "3 3 1\n1 1 2.5x\n") == Kind::bad_file);

    // Fewer entries than announced
    CHECK(read_error_kind(real_header + "3 3 3\n1 1 1\n2 2 2\n") == Kind::bad_file);
    CHECK(read_error_kind(real_header + "3 3 99999999999999999\n1 1 1\n")
          == Kind::bad_file);
  }

  TEST_CASE("matrix_market - read_integer_rejects_fractions", "[matrix_market]")
  {
    std::istringstream iss{
      "%%MatrixMarket matrix coordinate integer general\n"
      "1 1 1\n"
      "1 1 1.5\n"};
    try {
      read_matrix_market<double>(iss);
      FAIL("expected a Matrix_market_error");
    } catch (Matrix_market_error const& e) {
      CHECK(e.kind() == Kind::bad_file);
    }
  }

  TEST_CASE("matrix_market - read_unsupported", "[matrix_market]")
  {
    CHECK(read_error_kind(
            "%%MatrixMarket matrix coordinate real symmetric\n2 2 1\n1 1 1\n")
          == Kind::unsupported_format);
    CHECK(read_error_kind(
            "%%MatrixMarket matrix coordinate complex general\n2 2 1\n1 1 1 0\n")
          == Kind::unsupported_format);
    CHECK(read_error_kind(
            "%%MatrixMarket matrix coordinate pattern general\n2 2 1\n1 1\n")
          == Kind::unsupported_format);

    // Dense layout is not a sparse file
    CHECK(read_error_kind(
            "%%MatrixMarket matrix array real general\n2 2\n1\n2\n3\n4\n")
          == Kind::bad_file);
  }

  TEST_CASE("matrix_market - read_missing_file", "[matrix_market]")
  {
    auto path = std::filesystem::path{"/nonexistent/sparcon/missing.mtx"};
    try {
      read_matrix_market<double>(path);
      FAIL("expected a Matrix_market_error");
    } catch (Matrix_market_error const& e) {
      CHECK(e.kind() == Kind::io);
    }
  }

  // -- Write --

  TEST_CASE("matrix_market - write_coordinate", "[matrix_market]")
  {
    Coordinate_matrix<double> coo{Shape{2, 3}, {
      Entry<double>{Index{0, 2}, 1.5},
      Entry<double>{Index{1, 0}, -2.0}}};

    std::ostringstream oss;
    write_matrix_market(oss, coo);

    CHECK(oss.str()
          == "%%MatrixMarket matrix coordinate real general\n"
             "% written by sparcon\n"
             "2 3 2\n"
             "1 3 1.5\n"
             "2 1 -2\n");
  }

  TEST_CASE("matrix_market - write_compressed", "[matrix_market]")
  {
    Compressed_matrix<double> csc{
      Storage::column_major, Shape{2, 2}, {0, 1, 2}, {1, 0}, {4., 5.}};

    std::ostringstream oss;
    write_matrix_market(oss, csc);

    CHECK(oss.str()
          == "%%MatrixMarket matrix coordinate real general\n"
             "% written by sparcon\n"
             "2 2 2\n"
             "2 1 4\n"
             "1 2 5\n");
  }

  TEST_CASE("matrix_market - write_integer_and_complex", "[matrix_market]")
  {
    Coordinate_matrix<int> ints{Shape{1, 1}, {Entry<int>{Index{0, 0}, 7}}};
    std::ostringstream int_out;
    write_matrix_market(int_out, ints);
    CHECK(int_out.str()
          == "%%MatrixMarket matrix coordinate integer general\n"
             "% written by sparcon\n"
             "1 1 1\n"
             "1 1 7\n");

    using Complex = std::complex<double>;
    Coordinate_matrix<Complex> complexes{
      Shape{1, 2}, {Entry<Complex>{Index{0, 1}, Complex{1.0, -2.0}}}};
    std::ostringstream complex_out;
    write_matrix_market(complex_out, complexes);
    CHECK(complex_out.str()
          == "%%MatrixMarket matrix coordinate complex general\n"
             "% written by sparcon\n"
             "1 2 1\n"
             "1 2 1 -2\n");
  }

  TEST_CASE("matrix_market - write_restores_precision", "[matrix_market]")
  {
    std::ostringstream oss;
    oss.precision(3);
    write_matrix_market(oss, mat1());
    CHECK(oss.precision() == 3);
  }

  TEST_CASE("matrix_market - round_trip", "[matrix_market]")
  {
    Compressed_matrix<double> mat{
      Storage::row_major, Shape{2, 3}, {0, 2, 3}, {0, 2, 1},
      {0.1, 1.0 / 3.0, -2.5e-300}};

    std::stringstream ss;
    write_matrix_market(ss, mat);
    auto coo = read_matrix_market<double>(ss);

    CHECK(to_compressed(coo, Storage::row_major) == mat);
  }

  TEST_CASE("matrix_market - round_trip_column_major", "[matrix_market]")
  {
    auto mat = mat4();

    std::stringstream ss;
    write_matrix_market(ss, mat);
    auto coo = read_matrix_market<double>(ss);

    CHECK(coo.size() == mat.size());
    CHECK(to_compressed(coo, Storage::column_major) == mat);
  }

  TEST_CASE("matrix_market - file_round_trip", "[matrix_market]")
  {
    auto path =
      std::filesystem::temp_directory_path() / "sparcon_matrix_market_test.mtx";
    auto mat = mat1_vstack_mat2();

    write_matrix_market(path, mat);
    auto coo = read_matrix_market<double>(path);
    std::filesystem::remove(path);

    CHECK(to_compressed(coo, Storage::row_major) == mat);
    CHECK(to_compressed(coo, Storage::column_major) == to_column_major(mat));
  }

} // end of namespace sparcon::testing
