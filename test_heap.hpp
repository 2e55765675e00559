// Copyright 2025-2026 ocmap contributors
#ifndef OCMAP_DETAIL_TEST_HEAP_HPP
#define OCMAP_DETAIL_TEST_HEAP_HPP

//
// CAUTION: [global.hpp] MUST BE THE FIRST INCLUDE IN ALL SOURCE AND
// HEADER FILES !!!
#include "global.hpp"  // IWYU pragma: keep

#ifndef NDEBUG

#include <atomic>
#include <cstdint>
#include <new>

namespace ocmap::test {

/// Test helper to inject memory allocation faults: once armed, the
/// n-th allocation made through the global operator new throws
/// std::bad_alloc.  The replacement operator new lives in the test
/// harness and calls maybe_fail() before allocating.
class allocation_failure_injector final {
 public:
  /// Disarm the injector and zero the allocation counter.
  static void reset() noexcept {
    fail_on_nth_allocation_.store(0, std::memory_order_relaxed);
    allocation_counter.store(0, std::memory_order_release);
  }

  /// Arm the injector: allocation number \a n (counting from one)
  /// fails.  Zero disarms.
  static void fail_on_nth_allocation(
      std::uint64_t n OCMAP_DETAIL_USED_IN_DEBUG) noexcept {
    fail_on_nth_allocation_.store(n, std::memory_order_release);
  }

  /// Throw std::bad_alloc iff the injector is armed and this is the
  /// allocation it should fail.  Allocations after the failing one
  /// keep failing until reset().
  static void maybe_fail() {
    const auto fail_counter =
        fail_on_nth_allocation_.load(std::memory_order_acquire);
    if (OCMAP_DETAIL_UNLIKELY(fail_counter != 0) &&
        (allocation_counter.fetch_add(1, std::memory_order_relaxed) + 1 >=
         fail_counter)) {
      throw std::bad_alloc{};
    }
  }

 private:
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
  inline static std::atomic<std::uint64_t> allocation_counter{0};
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
  inline static std::atomic<std::uint64_t> fail_on_nth_allocation_{0};
};  // class allocation_failure_injector

/// Lexically scoped fault window: arms the injector on construction
/// and disarms it on destruction, including when the guarded
/// operation throws.
///
/// Note: This class is NOT thread-safe.  Allocations made by other
/// threads inside the window are counted too.
class [[nodiscard]] heap_fault_window final {
 public:
  explicit heap_fault_window(std::uint64_t fail_on_nth_allocation) noexcept {
    allocation_failure_injector::reset();
    allocation_failure_injector::fail_on_nth_allocation(
        fail_on_nth_allocation);
  }

  ~heap_fault_window() { allocation_failure_injector::reset(); }

  heap_fault_window(const heap_fault_window &) = delete;
  heap_fault_window(heap_fault_window &&) = delete;
  heap_fault_window &operator=(const heap_fault_window &) = delete;
  heap_fault_window &operator=(heap_fault_window &&) = delete;
};  // class heap_fault_window

}  // namespace ocmap::test

#define OCMAP_DETAIL_RESET_ALLOCATION_FAILURE_INJECTOR() \
  ocmap::test::allocation_failure_injector::reset()

#else  // !NDEBUG

#define OCMAP_DETAIL_RESET_ALLOCATION_FAILURE_INJECTOR()

#endif  // !NDEBUG

#endif  // OCMAP_DETAIL_TEST_HEAP_HPP
