// Copyright 2025-2026 ocmap contributors
#ifndef OCMAP_DETAIL_GLOBAL_HPP
#define OCMAP_DETAIL_GLOBAL_HPP

/// \file
/// Compiler and build configuration macros.
///
/// CAUTION: [global.hpp] MUST BE THE FIRST INCLUDE IN ALL SOURCE AND
/// HEADER FILES !!!

#ifdef _MSC_VER
#define OCMAP_DETAIL_MSVC 1
#endif

#if defined(__SANITIZE_THREAD__)
#define OCMAP_DETAIL_THREAD_SANITIZER 1
#elif defined(__has_feature)
#if __has_feature(thread_sanitizer)
#define OCMAP_DETAIL_THREAD_SANITIZER 1
#endif
#endif

#ifndef OCMAP_DETAIL_MSVC

#define OCMAP_DETAIL_LIKELY(x) __builtin_expect(static_cast<bool>(x), 1)
#define OCMAP_DETAIL_UNLIKELY(x) __builtin_expect(static_cast<bool>(x), 0)
#define OCMAP_DETAIL_NOINLINE __attribute__((noinline))

#define OCMAP_DETAIL_DO_PRAGMA(x) _Pragma(#x)

#ifdef __clang__
#define OCMAP_DETAIL_DISABLE_CLANG_WARNING(x) \
  _Pragma("clang diagnostic push")            \
      OCMAP_DETAIL_DO_PRAGMA(clang diagnostic ignored x)
#define OCMAP_DETAIL_RESTORE_CLANG_WARNINGS() _Pragma("clang diagnostic pop")
#define OCMAP_DETAIL_DISABLE_GCC_WARNING(x)
#define OCMAP_DETAIL_RESTORE_GCC_WARNINGS()
#else  // __clang__
#define OCMAP_DETAIL_DISABLE_CLANG_WARNING(x)
#define OCMAP_DETAIL_RESTORE_CLANG_WARNINGS()
#define OCMAP_DETAIL_DISABLE_GCC_WARNING(x) \
  _Pragma("GCC diagnostic push") OCMAP_DETAIL_DO_PRAGMA(GCC diagnostic ignored x)
#define OCMAP_DETAIL_RESTORE_GCC_WARNINGS() _Pragma("GCC diagnostic pop")
#endif  // __clang__

#else  // OCMAP_DETAIL_MSVC

#define OCMAP_DETAIL_LIKELY(x) (x)
#define OCMAP_DETAIL_UNLIKELY(x) (x)
#define OCMAP_DETAIL_NOINLINE __declspec(noinline)

#define OCMAP_DETAIL_DISABLE_CLANG_WARNING(x)
#define OCMAP_DETAIL_RESTORE_CLANG_WARNINGS()
#define OCMAP_DETAIL_DISABLE_GCC_WARNING(x)
#define OCMAP_DETAIL_RESTORE_GCC_WARNINGS()

#endif  // OCMAP_DETAIL_MSVC

#ifdef NDEBUG
#define OCMAP_DETAIL_USED_IN_DEBUG [[maybe_unused]]
#else
#define OCMAP_DETAIL_USED_IN_DEBUG
#endif

#endif  // OCMAP_DETAIL_GLOBAL_HPP
