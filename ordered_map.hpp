// Copyright 2025-2026 ocmap contributors
#ifndef OCMAP_DETAIL_ORDERED_MAP_HPP
#define OCMAP_DETAIL_ORDERED_MAP_HPP

// Should be the first include
#include "global.hpp"  // IWYU pragma: keep

// IWYU pragma: no_include <__fwd/ostream.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>  // IWYU pragma: keep
#include <iterator>
#include <mutex>
#include <optional>
#include <ostream>
#include <shared_mutex>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "assert.hpp"
#include "key_index.hpp"
#include "ordered_map_common.hpp"

namespace ocmap {

/// An associative container which keeps its keys in ascending order.
///
/// The entries live in a hash map, which answers point lookups in
/// O(1).  A separate ordered key index (the \a Index policy) drives the
/// ordered traversals and is kept in lock step with the hash map: a
/// key is in the index iff it has an entry.
///
/// All operations are serialized by one reader-writer \a Lock which
/// covers both the index and the entries.  Readers (load(), size(),
/// keys(), range(), scan()...) hold it shared for their whole duration,
/// writers (store(), remove(), load_or_store(), load_and_remove(),
/// clear()) hold it exclusively for their whole duration.  That makes
/// the compound operations atomic and every operation linearizable.
///
/// A callback passed to range() or scan() runs under the shared lock.
/// It MUST NOT modify the same map (deadlock), and a slow callback
/// stalls all writers.
///
/// \tparam Compare Strict weak ordering over the keys.
/// \tparam Hash Key hash.  Keys equivalent under \a Compare must hash
/// equally.
template <typename Key, typename Value, class Compare, class Hash,
          template <class, class> class Index, class Lock>
class basic_ordered_map final {
  static_assert(std::is_invocable_r_v<bool, const Compare &, const Key &,
                                      const Key &>,
                "Compare must order two keys");
  static_assert(
      std::is_invocable_r_v<std::size_t, const Hash &, const Key &>,
      "Hash must hash a key");

  using index_type = Index<Key, Compare>;
  using key_equal = detail::equivalent_keys<Key, Compare>;
  using entry_map = std::unordered_map<Key, Value, Hash, key_equal>;

 public:
  using key_type = Key;
  using value_type = Value;
  using key_compare = Compare;
  using size_type = std::size_t;
  using get_result = std::optional<Value>;
  using load_or_store_result = std::pair<Value, bool>;
  using visitor = ocmap::visitor<Key, Value>;

  // Creation and destruction
  explicit basic_ordered_map(const Compare &cmp = Compare{},
                             const Hash &hash = Hash{})
      : index{cmp}, entries(0, hash, key_equal{cmp}) {}

  ~basic_ordered_map() noexcept = default;

  basic_ordered_map(const basic_ordered_map &) = delete;
  basic_ordered_map(basic_ordered_map &&) = delete;
  basic_ordered_map &operator=(const basic_ordered_map &) = delete;
  basic_ordered_map &operator=(basic_ordered_map &&) = delete;

  // Querying

  // Return a copy of the value stored under k, if any.
  [[nodiscard]] get_result load(const Key &k) const {
    const std::shared_lock guard{mutex};
    const auto itr = entries.find(k);
    if (itr == entries.cend()) return {};
    return itr->second;
  }

  [[nodiscard]] bool contains(const Key &k) const {
    const std::shared_lock guard{mutex};
    return entries.find(k) != entries.cend();
  }

  [[nodiscard]] size_type size() const {
    const std::shared_lock guard{mutex};
    OCMAP_DETAIL_ASSERT(index.size() == entries.size());
    return entries.size();
  }

  [[nodiscard]] bool empty() const {
    const std::shared_lock guard{mutex};
    return entries.empty();
  }

  // Return a snapshot of the live keys in ascending order.
  [[nodiscard]] std::vector<Key> keys() const {
    const std::shared_lock guard{mutex};
    return std::vector<Key>(index.begin(), index.end());
  }

  // Modifying

  // Insert or overwrite the value stored under k.  Strong exception
  // guarantee.
  void store(const Key &k, Value v) {
    const std::unique_lock guard{mutex};
    // try_emplace leaves v alone when k is already there
    const auto [itr, inserted] = entries.try_emplace(k, std::move(v));
    if (!inserted) {
      itr->second = std::move(v);
      return;
    }
    add_to_index(itr);
  }

  // Remove the entry for k, if any.
  void remove(const Key &k) {
    const std::unique_lock guard{mutex};
    const auto itr = entries.find(k);
    if (itr == entries.end()) return;
    remove_entry(itr);
  }

  // If k is present, return its value and true without modifying the
  // map.  Otherwise store v under k and return v and false.
  [[nodiscard]] load_or_store_result load_or_store(const Key &k, Value v) {
    const std::unique_lock guard{mutex};
    const auto existing = entries.find(k);
    if (existing != entries.end()) return {existing->second, true};
    load_or_store_result result{v, false};
    const auto itr = entries.try_emplace(k, std::move(v)).first;
    add_to_index(itr);
    return result;
  }

  // If k is present, remove its entry and return the value.
  [[nodiscard]] get_result load_and_remove(const Key &k) {
    const std::unique_lock guard{mutex};
    const auto itr = entries.find(k);
    if (itr == entries.end()) return {};
    get_result result{std::move(itr->second)};
    remove_entry(itr);
    return result;
  }

  void clear() {
    const std::unique_lock guard{mutex};
#ifdef OCMAP_DETAIL_WITH_STATS
    remove_count += entries.size();
#endif
    index.clear();
    entries.clear();
  }

  // Traversal

  // Visit the entries in ascending key order.  fn(const Key &, const
  // Value &) returns false to stop the traversal.
  template <typename FN>
    requires std::is_invocable_r_v<bool, FN &, const Key &, const Value &>
  void range(FN fn) const {
    const std::shared_lock guard{mutex};
    for (const auto &k : index) {
      const auto itr = entries.find(k);
      OCMAP_DETAIL_ASSERT(itr != entries.cend());
      if (OCMAP_DETAIL_UNLIKELY(itr == entries.cend())) continue;
      if (!fn(itr->first, itr->second)) break;
    }
  }

  ///
  /// scan API
  ///

  // Scan the map, applying the caller's lambda to each visited entry.
  //
  // @param fn A function f(visitor&) returning [bool::halt].  The
  // traversal will halt if the function returns [true].
  //
  // @param fwd When [true] perform a forward scan, otherwise perform a
  // reverse scan.
  template <typename FN>
    requires std::is_invocable_r_v<bool, FN &, visitor &>
  void scan(FN fn, bool fwd = true) const {
    const std::shared_lock guard{mutex};
    if (fwd) {
      scan_entries(index.begin(), index.end(), fn);
    } else {
      scan_entries(std::make_reverse_iterator(index.end()),
                   std::make_reverse_iterator(index.begin()), fn);
    }
  }

  // Scan in the indicated direction starting at from_key.  A forward
  // scan starts at the first key GTE from_key, a reverse scan at the
  // last key LTE from_key.
  //
  // @param from_key is an inclusive bound for the starting point of
  // the scan.
  template <typename FN>
    requires std::is_invocable_r_v<bool, FN &, visitor &>
  void scan(const Key &from_key, FN fn, bool fwd = true) const {
    const std::shared_lock guard{mutex};
    if (fwd) {
      scan_entries(index.lower_bound(from_key), index.end(), fn);
    } else {
      scan_entries(std::make_reverse_iterator(index.upper_bound(from_key)),
                   std::make_reverse_iterator(index.begin()), fn);
    }
  }

  // Scan the key range, applying the caller's lambda to each visited
  // entry.  The scan proceeds in ascending order iff from_key orders
  // before to_key and in descending order iff to_key orders before
  // from_key.  Nothing is visited if the keys are equivalent.
  //
  // @param from_key is an inclusive bound for the starting point of
  // the scan.
  //
  // @param to_key is an exclusive bound for the ending point of the
  // scan.
  template <typename FN>
    requires std::is_invocable_r_v<bool, FN &, visitor &>
  void scan_range(const Key &from_key, const Key &to_key, FN fn) const {
    const std::shared_lock guard{mutex};
    const auto cmp = entries.key_eq().cmp;
    if (cmp(from_key, to_key)) {
      scan_entries(index.lower_bound(from_key), index.lower_bound(to_key), fn);
    } else if (cmp(to_key, from_key)) {
      scan_entries(std::make_reverse_iterator(index.upper_bound(from_key)),
                   std::make_reverse_iterator(index.upper_bound(to_key)), fn);
    }
  }

  // Stats

#ifdef OCMAP_DETAIL_WITH_STATS

  // Number of keys inserted over the lifetime of the map.  Overwrites
  // of a present key are not counted.
  [[nodiscard]] std::uint64_t get_insert_count() const {
    const std::shared_lock guard{mutex};
    return insert_count;
  }

  // Number of keys removed over the lifetime of the map.
  [[nodiscard]] std::uint64_t get_remove_count() const {
    const std::shared_lock guard{mutex};
    return remove_count;
  }

#endif  // OCMAP_DETAIL_WITH_STATS

  // Debugging
  [[gnu::cold]] OCMAP_DETAIL_NOINLINE void dump(std::ostream &os) const {
    const std::shared_lock guard{mutex};
    os << "ordered_map: size = " << entries.size() << '\n';
#ifdef OCMAP_DETAIL_WITH_STATS
    os << "inserts = " << insert_count << ", removes = " << remove_count
       << '\n';
#endif
    for (const auto &k : index) {
      os << "  ";
      detail::dump_item(os, k);
      os << " -> ";
      const auto itr = entries.find(k);
      if (itr == entries.cend()) {
        os << "(missing entry)\n";
        continue;
      }
      detail::dump_item(os, itr->second);
      os << '\n';
    }
  }

 private:
  using entry_iterator = typename entry_map::iterator;

  // Make a newly emplaced entry visible in the index.  Rolls back the
  // entry if the index cannot grow.
  void add_to_index(entry_iterator itr) {
    try {
      index.insert(itr->first);
    } catch (...) {
      entries.erase(itr);
      throw;
    }
#ifdef OCMAP_DETAIL_WITH_STATS
    ++insert_count;
#endif
  }

  void remove_entry(entry_iterator itr) {
    index.remove(itr->first);
    entries.erase(itr);
#ifdef OCMAP_DETAIL_WITH_STATS
    ++remove_count;
#endif
    OCMAP_DETAIL_ASSERT(index.size() == entries.size());
  }

  template <typename Iterator, typename FN>
  void scan_entries(Iterator first, Iterator last, FN &fn) const {
    for (; first != last; ++first) {
      const auto itr = entries.find(*first);
      OCMAP_DETAIL_ASSERT(itr != entries.cend());
      if (OCMAP_DETAIL_UNLIKELY(itr == entries.cend())) continue;
      visitor v{itr->first, itr->second};
      if (fn(v)) break;
    }
  }

  index_type index;
  entry_map entries;

  mutable Lock mutex;

#ifdef OCMAP_DETAIL_WITH_STATS
  std::uint64_t insert_count{0};
  std::uint64_t remove_count{0};
#endif
};

/// Ordered map for single-threaded use.
template <typename Key, typename Value, class Compare = std::less<Key>,
          class Hash = std::hash<Key>>
using ordered_map = basic_ordered_map<Key, Value, Compare, Hash,
                                      detail::sorted_vector_key_index,
                                      fake_shared_mutex>;

/// Ordered map safe for concurrent readers and writers.
template <typename Key, typename Value, class Compare = std::less<Key>,
          class Hash = std::hash<Key>>
using concurrent_ordered_map =
    basic_ordered_map<Key, Value, Compare, Hash,
                      detail::sorted_vector_key_index, std::shared_mutex>;

/// Concurrent ordered map with a tree index, for large key counts.
template <typename Key, typename Value, class Compare = std::less<Key>,
          class Hash = std::hash<Key>>
using concurrent_tree_ordered_map =
    basic_ordered_map<Key, Value, Compare, Hash, detail::tree_key_index,
                      std::shared_mutex>;

}  // namespace ocmap

#endif  // OCMAP_DETAIL_ORDERED_MAP_HPP
