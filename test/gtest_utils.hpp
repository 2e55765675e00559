// Copyright 2025-2026 ocmap contributors
#ifndef OCMAP_DETAIL_GTEST_UTILS_HPP
#define OCMAP_DETAIL_GTEST_UTILS_HPP

// Should be the first include
#include "global.hpp"  // IWYU pragma: keep

#include <gtest/gtest.h>

// Silence the warnings that the GoogleTest macros trigger under the
// project warning flags.

#define OCMAP_START_TESTS()                                      \
  OCMAP_DETAIL_DISABLE_CLANG_WARNING("-Wused-but-marked-unused") \
  OCMAP_DETAIL_DISABLE_GCC_WARNING("-Wsuggest-attribute=noreturn")

#define OCMAP_END_TESTS()              \
  OCMAP_DETAIL_RESTORE_GCC_WARNINGS()  \
  OCMAP_DETAIL_RESTORE_CLANG_WARNINGS()

#define OCMAP_START_TYPED_TESTS()                                        \
  OCMAP_START_TESTS()                                                    \
  OCMAP_DETAIL_DISABLE_CLANG_WARNING("-Wgnu-zero-variadic-macro-arguments")

#define OCMAP_END_TYPED_TESTS()         \
  OCMAP_DETAIL_RESTORE_CLANG_WARNINGS() \
  OCMAP_END_TESTS()

#define OCMAP_TYPED_TEST_SUITE(Suite, Types)                               \
  OCMAP_DETAIL_DISABLE_CLANG_WARNING("-Wgnu-zero-variadic-macro-arguments") \
  TYPED_TEST_SUITE(Suite, Types);                                          \
  OCMAP_DETAIL_RESTORE_CLANG_WARNINGS()

#define OCMAP_EXPECT_TRUE(x) EXPECT_TRUE(x)
#define OCMAP_EXPECT_FALSE(x) EXPECT_FALSE(x)
#define OCMAP_EXPECT_EQ(a, b) EXPECT_EQ(a, b)
#define OCMAP_EXPECT_NE(a, b) EXPECT_NE(a, b)
#define OCMAP_EXPECT_LT(a, b) EXPECT_LT(a, b)
#define OCMAP_ASSERT_TRUE(x) ASSERT_TRUE(x)
#define OCMAP_ASSERT_FALSE(x) ASSERT_FALSE(x)
#define OCMAP_ASSERT_EQ(a, b) ASSERT_EQ(a, b)

#endif  // OCMAP_DETAIL_GTEST_UTILS_HPP
