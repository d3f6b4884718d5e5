#pragma once
/**
 * @file primitives.hpp
 * @brief Blocking log transfer and one-byte rendezvous over any gutter.
 *
 * Transfer
 *  - pick_up(g, log): read exactly sizeof(log) bytes into log.
 *  - throw_(g, log):  write exactly sizeof(log) bytes of log.
 *
 * Synchronization
 *  - hail(g): write the single byte 0x0A.
 *  - wait(g): read one byte and discard it (its value is never checked).
 *
 * Composites (short-circuit on the first failure)
 *  - pick_up_and_hail(g, log): pick_up, then hail.
 *  - throw_and_wait(g, log):   throw_, then wait.
 *
 * Every call borrows its arguments for its own duration, blocks the calling
 * thread and holds no state. Bytes are moved in native order; peers must
 * share the layout of every log type. `throw` is a keyword, hence throw_.
 *
 * Usage:
 *   auto [a, b] = *gutters::io::make_socket_pair();
 *   // thread A                               // thread B
 *   gutters::throw_and_wait(a, 42.0);          double x{};
 *                                              gutters::pick_up_and_hail(b, x);
 */

#include "gutters/config/constants.hpp"
#include "gutters/io/error.hpp"
#include "gutters/io/exact_io.hpp"
#include "gutters/io/gutter_traits.hpp"
#include "gutters/mem/byte_view.hpp"

namespace gutters {

/// @brief Read a log of type T from @p gutter, overwriting @p buffer.
/// @note On error the contents of @p buffer are unspecified.
template <class Gutter, class T>
IoResult pick_up(Gutter& gutter, T& buffer) {
  static_assert(io::is_readable_gutter_v<Gutter>,
                "gutters::pick_up needs a gutter with read_some()");
  return io::read_exact(gutter, mem::as_writable_bytes(buffer));
}

/// @brief Send the log @p buffer to @p gutter.
template <class Gutter, class T>
IoResult throw_(Gutter& gutter, const T& buffer) {
  static_assert(io::is_writable_gutter_v<Gutter>,
                "gutters::throw_ needs a gutter with write_some()");
  return io::write_all(gutter, mem::as_bytes(buffer));
}

/// @brief Send the one-byte acknowledgment (0x0A) to @p gutter.
template <class Gutter>
IoResult hail(Gutter& gutter) {
  static_assert(io::is_writable_gutter_v<Gutter>,
                "gutters::hail needs a gutter with write_some()");
  const std::byte token[1] = {config::constants::HAIL_BYTE};
  return io::write_all(gutter, std::span<const std::byte>(token));
}

/// @brief Wait for one byte from @p gutter. Any value is accepted.
template <class Gutter>
IoResult wait(Gutter& gutter) {
  static_assert(io::is_readable_gutter_v<Gutter>,
                "gutters::wait needs a gutter with read_some()");
  std::byte token[1] = {};
  return io::read_exact(gutter, std::span<std::byte>(token));
}

/// @brief pick_up() then hail(). hail() is skipped if pick_up() fails.
template <class Gutter, class T>
IoResult pick_up_and_hail(Gutter& gutter, T& buffer) {
  static_assert(io::is_duplex_gutter_v<Gutter>,
                "gutters::pick_up_and_hail needs read_some() and write_some()");
  if (IoResult r = pick_up(gutter, buffer); !r) return r;
  return hail(gutter);
}

/// @brief throw_() then wait(). wait() is skipped if throw_() fails.
///
/// Success only means the peer sent one more byte after receiving the log,
/// not that it understood the log.
template <class Gutter, class T>
IoResult throw_and_wait(Gutter& gutter, const T& buffer) {
  static_assert(io::is_duplex_gutter_v<Gutter>,
                "gutters::throw_and_wait needs read_some() and write_some()");
  if (IoResult r = throw_(gutter, buffer); !r) return r;
  return wait(gutter);
}

} // namespace gutters
