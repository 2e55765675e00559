// Copyright 2025-2026 ocmap contributors
#ifndef OCMAP_DETAIL_KEY_INDEX_HPP
#define OCMAP_DETAIL_KEY_INDEX_HPP

/// \file
/// Ordered key index policies for basic_ordered_map.
///
/// An index holds the live keys of a map in ascending order without
/// duplicates.  It is not synchronized: the owning map serializes all
/// access under its lock.  Both policies expose the same interface:
///
/// - insert(k): add a key that is not in the index.
/// - remove(k): drop a key that is in the index.
/// - lower_bound(k), upper_bound(k), begin(), end(): bidirectional
///   const iterators in ascending order.
/// - size(), empty(), clear().
/// \ingroup internal

// Should be the first include
#include "global.hpp"  // IWYU pragma: keep

#include <algorithm>
#include <cstddef>
#include <set>
#include <vector>

#include "assert.hpp"

namespace ocmap::detail {

/// Sorted vector index.  Positions are found by binary search.  Insert
/// and remove shift the tail of the vector by one slot, which is O(n)
/// in the worst case, but the keys stay contiguous and lookups and
/// traversals are cache friendly.  This is the default index.
template <typename Key, class Compare>
class [[nodiscard]] sorted_vector_key_index final {
  using container_type = std::vector<Key>;

 public:
  using key_type = Key;
  using size_type = typename container_type::size_type;
  using const_iterator = typename container_type::const_iterator;

  explicit sorted_vector_key_index(const Compare &cmp_) : cmp{cmp_} {}

  // Return the first position whose key is not less than k.  All the
  // keys before it order before k.
  [[nodiscard]] const_iterator lower_bound(const Key &k) const {
    return std::lower_bound(keys.cbegin(), keys.cend(), k, cmp);
  }

  // Return the first position whose key orders after k.
  [[nodiscard]] const_iterator upper_bound(const Key &k) const {
    return std::upper_bound(keys.cbegin(), keys.cend(), k, cmp);
  }

  // Insert a key which is not present.  The key lands at its lower
  // bound: position 0 for an empty index, the tail for a key greater
  // than all others.  Strong exception guarantee.
  void insert(const Key &k) {
    const auto pos = lower_bound(k);
    OCMAP_DETAIL_ASSERT(pos == keys.cend() || cmp(k, *pos));
    keys.insert(pos, k);
  }

  // Remove a key which is present.  The key must be found exactly at
  // its lower bound.
  void remove(const Key &k) {
    const auto pos = lower_bound(k);
    const auto found = pos != keys.cend() && !cmp(k, *pos);
    OCMAP_DETAIL_ASSERT(found);
    if (OCMAP_DETAIL_LIKELY(found)) keys.erase(pos);
  }

  [[nodiscard]] const_iterator begin() const noexcept { return keys.cbegin(); }
  [[nodiscard]] const_iterator end() const noexcept { return keys.cend(); }

  [[nodiscard]] size_type size() const noexcept { return keys.size(); }
  [[nodiscard]] bool empty() const noexcept { return keys.empty(); }

  void clear() noexcept { keys.clear(); }

 private:
  container_type keys;
  Compare cmp;
};  // class sorted_vector_key_index

/// Balanced tree index.  Insert and remove are O(log n) and never
/// move other keys, at the cost of one heap node per key.  Use it for
/// maps with many keys and frequent structural changes.
template <typename Key, class Compare>
class [[nodiscard]] tree_key_index final {
  using container_type = std::set<Key, Compare>;

 public:
  using key_type = Key;
  using size_type = typename container_type::size_type;
  using const_iterator = typename container_type::const_iterator;

  explicit tree_key_index(const Compare &cmp) : keys(cmp) {}

  [[nodiscard]] const_iterator lower_bound(const Key &k) const {
    return keys.lower_bound(k);
  }

  [[nodiscard]] const_iterator upper_bound(const Key &k) const {
    return keys.upper_bound(k);
  }

  void insert(const Key &k) {
    OCMAP_DETAIL_USED_IN_DEBUG const auto [pos, inserted] = keys.insert(k);
    OCMAP_DETAIL_ASSERT(inserted);
  }

  void remove(const Key &k) {
    OCMAP_DETAIL_USED_IN_DEBUG const auto n_removed = keys.erase(k);
    OCMAP_DETAIL_ASSERT(n_removed == 1);
  }

  [[nodiscard]] const_iterator begin() const noexcept { return keys.cbegin(); }
  [[nodiscard]] const_iterator end() const noexcept { return keys.cend(); }

  [[nodiscard]] size_type size() const noexcept { return keys.size(); }
  [[nodiscard]] bool empty() const noexcept { return keys.empty(); }

  void clear() noexcept { keys.clear(); }

 private:
  container_type keys;
};  // class tree_key_index

}  // namespace ocmap::detail

#endif  // OCMAP_DETAIL_KEY_INDEX_HPP
