// Copyright 2025-2026 ocmap contributors
#ifndef OCMAP_DETAIL_ASSERT_HPP
#define OCMAP_DETAIL_ASSERT_HPP

/// \file
/// Internal invariant checks.
///
/// The checks are active in debug builds only.  A failed check prints
/// the condition and the source location to std::cerr and aborts the
/// process: an internal invariant violation is a bug, not a condition
/// the caller can handle.
/// \ingroup internal

// Should be the first include
#include "global.hpp"  // IWYU pragma: keep

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

namespace ocmap::detail {

[[noreturn, gnu::cold]] OCMAP_DETAIL_NOINLINE inline void msg_abort(
    const std::string &msg) noexcept {
  std::cerr << msg << std::flush;
  std::abort();
}

[[noreturn, gnu::cold]] OCMAP_DETAIL_NOINLINE inline void assert_failure(
    const char *file, int line, const char *func,
    const char *condition) noexcept {
  std::ostringstream buf;
  buf << "Assertion \"" << condition << "\" failed at " << file << ':' << line
      << ", function \"" << func << "\"\n";
  msg_abort(buf.str());
}

}  // namespace ocmap::detail

#ifndef NDEBUG

#define OCMAP_DETAIL_ASSERT(condition)                                     \
  OCMAP_DETAIL_UNLIKELY(!(condition))                                      \
  ? ocmap::detail::assert_failure(__FILE__, __LINE__, __func__, #condition) \
  : ((void)0)

#else  // !NDEBUG

#define OCMAP_DETAIL_ASSERT(condition) ((void)0)

#endif  // !NDEBUG

#endif  // OCMAP_DETAIL_ASSERT_HPP
