#include <sparcon/data/Storage.hpp>

namespace sparcon::data::detail {

  Storage
  other_storage(Storage storage)
  {
    return storage == Storage::row_major
      ? Storage::column_major
      : Storage::row_major;
  }

  std::string
  to_string(Storage storage)
  {
    switch (storage) {
    case Storage::row_major: return "row_major";
    case Storage::column_major: return "column_major";
    }
    throw logic_error("unknown storage");
  }

} // end of namespace sparcon::data::detail
