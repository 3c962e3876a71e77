#pragma once

//
// ... Standard header files
//
#include <initializer_list>
#include <span>
#include <stdexcept>
#include <vector>

//
// ... sparcon header files
//
#include <sparcon/config.hpp>
#include <sparcon/data/Entry.hpp>
#include <sparcon/data/Shape.hpp>

namespace sparcon::data::detail {

  /**
   * @brief Triplet (coordinate) matrix: a shape and a list of entries in
   * insertion order.
   *
   * Several entries may share an index; they stand for the sum of their
   * values.
   */
  template <typename T = config::value_type>
  class Coordinate_matrix final {
  public:
    using size_type = config::size_type;

    explicit Coordinate_matrix(Shape shape) : shape_(shape) {}

    Coordinate_matrix(Shape shape, std::initializer_list<Entry<T>> const& input)
        : Coordinate_matrix(shape, input.begin(), input.end()) {}

    template <typename Iter>
    Coordinate_matrix(Shape shape, Iter first, Iter last) : shape_(shape) {
      for (auto it = first; it != last; ++it) {
        add(it->index, it->value);
      }
    }

    /// @throws std::invalid_argument if @p index lies outside the shape.
    void
    add(Index index, T value) {
      if (index.row() >= shape_.row() || index.column() >= shape_.column()) {
        throw std::invalid_argument("coordinate matrix: index out of range");
      }
      entries_.push_back(Entry<T>{index, value});
    }

    void
    reserve(size_type n) {
      entries_.reserve(static_cast<std::size_t>(n));
    }

    /// @brief Return the number of entries, duplicates included.
    size_type
    size() const {
      return static_cast<size_type>(entries_.size());
    }

    Shape
    shape() const {
      return shape_;
    }

    std::span<Entry<T> const>
    entries() const {
      return entries_;
    }

    T
    operator()(size_type row, size_type col) const {
      T sum{0};
      for (auto const& entry : entries_) {
        if (entry.index.row() == row && entry.index.column() == col) {
          sum += entry.value;
        }
      }
      return sum;
    }

  private:
    Shape shape_;
    std::vector<Entry<T>> entries_;

  }; // end of class Coordinate_matrix

} // end of namespace sparcon::data::detail
