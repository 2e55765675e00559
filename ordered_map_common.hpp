// Copyright 2025-2026 ocmap contributors
#ifndef OCMAP_DETAIL_ORDERED_MAP_COMMON_HPP
#define OCMAP_DETAIL_ORDERED_MAP_COMMON_HPP

// Should be the first include
#include "global.hpp"  // IWYU pragma: keep

// IWYU pragma: no_include <__fwd/ostream.h>

#include <iosfwd>  // IWYU pragma: keep
#include <ostream>
#include <type_traits>
#include <utility>

namespace ocmap {

template <typename Key, typename Value, class Compare, class Hash,
          template <class, class> class Index, class Lock>
class basic_ordered_map;

/// An object visited by the scan API.  The map passes a visitor to
/// the caller's lambda for each entry visited by the scan.
///
/// Note: The lambda MUST NOT export a reference to the visited key or
/// value.  The references are only valid while the scan holds the map
/// lock, i.e. for the duration of a single lambda invocation.  Copy
/// the data if you need it afterwards.
template <typename Key, typename Value>
class visitor {
 protected:
  visitor(const Key &key_, const Value &value_) noexcept
      : k(key_), v(value_) {}

 public:
  using key_type = Key;
  using value_type = Value;

  /// Visit the key.
  [[nodiscard]] const Key &get_key() const noexcept { return k; }

  /// Visit the value.
  [[nodiscard]] const Value &get_value() const noexcept { return v; }

 private:
  const Key &k;
  const Value &v;

  template <typename, typename, class, class, template <class, class> class,
            class>
  friend class basic_ordered_map;
};  // class visitor

/// A lock with no effect, satisfying the SharedMutex requirements.
/// Used to instantiate the map for single-threaded use.
class fake_shared_mutex final {
 public:
  constexpr fake_shared_mutex() noexcept = default;

  fake_shared_mutex(const fake_shared_mutex &) = delete;
  fake_shared_mutex(fake_shared_mutex &&) = delete;
  fake_shared_mutex &operator=(const fake_shared_mutex &) = delete;
  fake_shared_mutex &operator=(fake_shared_mutex &&) = delete;

  constexpr void lock() noexcept {}
  [[nodiscard]] constexpr bool try_lock() noexcept { return true; }
  constexpr void unlock() noexcept {}

  constexpr void lock_shared() noexcept {}
  [[nodiscard]] constexpr bool try_lock_shared() noexcept { return true; }
  constexpr void unlock_shared() noexcept {}
};

namespace detail {

/// Key equality derived from the map ordering: two keys are equal iff
/// neither orders before the other.
template <typename Key, class Compare>
struct [[nodiscard]] equivalent_keys {
  explicit equivalent_keys(const Compare &cmp_) : cmp(cmp_) {}

  [[nodiscard]] bool operator()(const Key &lhs, const Key &rhs) const {
    return !cmp(lhs, rhs) && !cmp(rhs, lhs);
  }

  Compare cmp;
};

template <typename T, typename = void>
struct is_ostreamable : std::false_type {};

template <typename T>
struct is_ostreamable<T, std::void_t<decltype(std::declval<std::ostream &>()
                                              << std::declval<const T &>())>>
    : std::true_type {};

/// Dump \a x if it has a stream insertion operator, a placeholder
/// otherwise.
template <typename T>
[[gnu::cold]] void dump_item(std::ostream &os, const T &x) {
  if constexpr (is_ostreamable<T>::value) {
    os << x;
  } else {
    os << "<" << sizeof(T) << " bytes>";
  }
}

}  // namespace detail

}  // namespace ocmap

#endif  // OCMAP_DETAIL_ORDERED_MAP_COMMON_HPP
