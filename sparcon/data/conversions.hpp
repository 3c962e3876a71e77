#pragma once

//
// ... Standard header files
//
#include <algorithm>
#include <utility>
#include <vector>

//
// ... sparcon header files
//
#include <sparcon/config.hpp>
#include <sparcon/data/Compressed_matrix.hpp>
#include <sparcon/data/Coordinate_matrix.hpp>
#include <sparcon/data/Storage.hpp>

namespace sparcon::data::detail {

  // -- CSR <-> CSC --

  /**
   * @brief Return a copy of @p mat stored in @p target orientation.
   *
   * Switching orientation is a counting sort over the inner indices:
   * count the entries of each new outer slot, turn the counts into
   * offsets, then scatter the entries while walking the old outer slots in
   * order, which leaves the new inner indices sorted.
   */
  template<typename T>
  Compressed_matrix<T>
  to_storage(Compressed_matrix<T> const& mat, Storage target)
  {
    if (mat.storage() == target) { return mat; }

    auto op = mat.outer_ptr();
    auto ii = mat.inner_ind();
    auto sv = mat.values();
    auto old_outer = mat.outer_dim();
    auto new_outer = mat.inner_dim();

    // Count entries per new outer slot
    std::vector<size_type> outer_ptr(static_cast<std::size_t>(new_outer + 1), 0);
    for (auto i : ii) {
      ++outer_ptr[static_cast<std::size_t>(i)];
    }

    // Prefix sum
    size_type running = 0;
    for (std::size_t k = 0; k < outer_ptr.size(); ++k) {
      size_type count = outer_ptr[k];
      outer_ptr[k] = running;
      running += count;
    }

    // Place entries
    std::vector<size_type> inner_ind(static_cast<std::size_t>(mat.size()));
    std::vector<T> values(static_cast<std::size_t>(mat.size()));
    std::vector<size_type> work(outer_ptr.begin(), outer_ptr.end());

    for (size_type k = 0; k < old_outer; ++k) {
      for (auto p = op[k]; p < op[k + 1]; ++p) {
        auto dest = work[static_cast<std::size_t>(ii[p])]++;
        inner_ind[static_cast<std::size_t>(dest)] = k;
        values[static_cast<std::size_t>(dest)] = sv[p];
      }
    }

    return Compressed_matrix<T>{
      target, mat.shape(),
      std::move(outer_ptr), std::move(inner_ind), std::move(values)};
  }

  template<typename T>
  Compressed_matrix<T>
  to_row_major(Compressed_matrix<T> const& mat)
  {
    return to_storage(mat, Storage::row_major);
  }

  template<typename T>
  Compressed_matrix<T>
  to_column_major(Compressed_matrix<T> const& mat)
  {
    return to_storage(mat, Storage::column_major);
  }

  // -- COO to CSR / CSC --

  /**
   * @brief Compress a triplet matrix into @p storage orientation.
   *
   * Entries sharing an index are summed. Inner indices come out sorted
   * within each outer slot.
   */
  template<typename T>
  Compressed_matrix<T>
  to_compressed(Coordinate_matrix<T> const& coo, Storage storage)
  {
    auto shape = coo.shape();
    auto entries = coo.entries();
    auto row_major = storage == Storage::row_major;
    auto outer = outer_dim(storage, shape);

    auto outer_of = [row_major](auto const& e) {
      return row_major ? e.index.row() : e.index.column();
    };
    auto inner_of = [row_major](auto const& e) {
      return row_major ? e.index.column() : e.index.row();
    };

    // Bucket entries by outer slot, keeping insertion order in each bucket
    std::vector<size_type> start(static_cast<std::size_t>(outer + 1), 0);
    for (auto const& e : entries) {
      ++start[static_cast<std::size_t>(outer_of(e) + 1)];
    }
    for (std::size_t k = 1; k < start.size(); ++k) {
      start[k] += start[k - 1];
    }

    std::vector<std::pair<size_type, T>> buckets(entries.size());
    std::vector<size_type> work(start.begin(), start.end());
    for (auto const& e : entries) {
      auto dest = work[static_cast<std::size_t>(outer_of(e))]++;
      buckets[static_cast<std::size_t>(dest)] = {inner_of(e), e.value};
    }

    // Sort each bucket and sum duplicates
    std::vector<size_type> outer_ptr(static_cast<std::size_t>(outer + 1), 0);
    std::vector<size_type> inner_ind;
    std::vector<T> values;
    inner_ind.reserve(entries.size());
    values.reserve(entries.size());

    for (size_type k = 0; k < outer; ++k) {
      auto first = buckets.begin() + start[static_cast<std::size_t>(k)];
      auto last = buckets.begin() + start[static_cast<std::size_t>(k + 1)];
      std::stable_sort(first, last, [](auto const& a, auto const& b) {
        return a.first < b.first;
      });

      auto slot_begin = inner_ind.size();
      for (auto it = first; it != last; ++it) {
        if (inner_ind.size() > slot_begin && inner_ind.back() == it->first) {
          values.back() += it->second;
        } else {
          inner_ind.push_back(it->first);
          values.push_back(it->second);
        }
      }
      outer_ptr[static_cast<std::size_t>(k + 1)] =
        static_cast<size_type>(inner_ind.size());
    }

    return Compressed_matrix<T>{
      storage, shape,
      std::move(outer_ptr), std::move(inner_ind), std::move(values)};
  }

} // end of namespace sparcon::data::detail
