#pragma once
/**
 * @file exact_io.hpp
 * @brief Exact-count loops over a gutter's read_some / write_some.
 *
 * read_exact() and write_all() keep calling the gutter until the whole span
 * has moved. EINTR is retried; every other error is returned unchanged and
 * ends the loop. Bytes already moved when an error occurs are not reported.
 */

#include <cstddef>
#include <span>
#include <system_error>

#include "gutters/io/error.hpp"
#include "gutters/io/gutter_traits.hpp"

namespace gutters::io {

/// @brief True for the transient "interrupted by a signal" condition.
inline bool is_interrupted(const std::error_code& ec) noexcept {
  return ec == std::errc::interrupted;
}

/**
 * @brief Fill @p buf completely from @p gutter.
 * @return GutterError::UnexpectedEof if the stream ends first (even after
 *         zero bytes), or the gutter's own error.
 */
template <class Gutter>
IoResult read_exact(Gutter& gutter, std::span<std::byte> buf) {
  static_assert(is_readable_gutter_v<Gutter>,
                "gutters: read_exact needs a gutter with read_some()");
  while (!buf.empty()) {
    IoCount n = gutter.read_some(buf);
    if (!n) {
      if (is_interrupted(n.error())) continue;
      return io_error(n.error());
    }
    if (*n == 0) {
      return io_error(make_error_code(GutterError::UnexpectedEof));
    }
    buf = buf.subspan(*n);
  }
  return {};
}

/**
 * @brief Write all of @p buf to @p gutter, continuing after short writes.
 * @return GutterError::WriteZero if the gutter stops accepting bytes, or the
 *         gutter's own error.
 */
template <class Gutter>
IoResult write_all(Gutter& gutter, std::span<const std::byte> buf) {
  static_assert(is_writable_gutter_v<Gutter>,
                "gutters: write_all needs a gutter with write_some()");
  while (!buf.empty()) {
    IoCount n = gutter.write_some(buf);
    if (!n) {
      if (is_interrupted(n.error())) continue;
      return io_error(n.error());
    }
    if (*n == 0) {
      return io_error(make_error_code(GutterError::WriteZero));
    }
    buf = buf.subspan(*n);
  }
  return {};
}

} // namespace gutters::io
