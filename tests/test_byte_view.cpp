/**
 * @file test_byte_view.cpp
 * @brief Tests for the raw byte views over logs (mem/byte_view.hpp).
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>

#include "gutters/mem/byte_view.hpp"

using gutters::mem::as_bytes;
using gutters::mem::as_writable_bytes;
using gutters::mem::is_log_v;

namespace {
struct Sample {
  std::uint32_t id;
  float         value;
  std::int16_t  pair[2];
};
} // namespace

// ---------- LogTraits ----------

TEST(ByteView, LogTraits_AcceptsPlainTypes) {
  static_assert(is_log_v<double>);
  static_assert(is_log_v<std::uint8_t>);
  static_assert(is_log_v<const std::int64_t>);
  static_assert(is_log_v<Sample>);
  static_assert(is_log_v<std::array<float, 4>>);
  static_assert(is_log_v<int[3]>);
  SUCCEED();
}

TEST(ByteView, LogTraits_RejectsIndirectionAndVolatile) {
  static_assert(!is_log_v<int*>);
  static_assert(!is_log_v<const char*>);
  static_assert(!is_log_v<int* [2]>);
  static_assert(!is_log_v<int Sample::*>);
  static_assert(!is_log_v<std::nullptr_t>);
  static_assert(!is_log_v<volatile int>);
  SUCCEED();
}

// ---------- Views ----------

TEST(ByteView, Length_IsExactlySizeof) {
  double d = 0.0;
  Sample s{};
  std::array<std::uint16_t, 5> a{};
  EXPECT_EQ(as_bytes(d).size(), sizeof(double));
  EXPECT_EQ(as_bytes(s).size(), sizeof(Sample));
  EXPECT_EQ(as_writable_bytes(a).size(), sizeof(a));
  static_assert(decltype(as_bytes(d))::extent == sizeof(double));
}

TEST(ByteView, Aliases_NoCopy) {
  Sample s{};
  auto view = as_bytes(s);
  EXPECT_EQ(static_cast<const void*>(view.data()), static_cast<const void*>(&s));
}

TEST(ByteView, Immutable_MatchesObjectRepresentation) {
  const std::uint32_t v = 0x11223344u;
  auto view = as_bytes(v);
  unsigned char expect[sizeof(v)];
  std::memcpy(expect, &v, sizeof(v));
  for (std::size_t i = 0; i < sizeof(v); ++i) {
    EXPECT_EQ(std::to_integer<unsigned char>(view[i]), expect[i]) << "byte " << i;
  }
}

TEST(ByteView, Mutable_WritesThroughToValue) {
  double target = 0.0;
  const double source = 42.0;
  auto dst = as_writable_bytes(target);
  auto src = as_bytes(source);
  std::copy(src.begin(), src.end(), dst.begin());
  EXPECT_EQ(target, 42.0);
}

TEST(ByteView, Mutable_ArrayLog) {
  int arr[3] = {0, 0, 0};
  auto view = as_writable_bytes(arr);
  ASSERT_EQ(view.size(), sizeof(arr));
  const int ones[3] = {1, 2, 3};
  std::memcpy(view.data(), ones, sizeof(ones));
  EXPECT_EQ(arr[0], 1);
  EXPECT_EQ(arr[1], 2);
  EXPECT_EQ(arr[2], 3);
}
