#pragma once
/**
 * @file gutter_traits.hpp
 * @brief Detection of the two gutter capabilities (read / write).
 *
 * A gutter is any object offering one or both of:
 *
 *   IoCount read_some(std::span<std::byte> buf);         // 0 == end of stream
 *   IoCount write_some(std::span<const std::byte> buf);  // bytes accepted
 *
 * Both block until at least one byte moved, the stream ended, or an error
 * occurred. No base class is required; the primitives are templates and
 * check the capability they need at compile time.
 */

#include <cstddef>
#include <span>
#include <type_traits>
#include <utility>

#include "gutters/io/error.hpp"

namespace gutters::io {

template <class G, class = void>
struct is_readable_gutter : std::false_type {};

template <class G>
struct is_readable_gutter<G, std::void_t<decltype(
    std::declval<G&>().read_some(std::declval<std::span<std::byte>>()))>>
  : std::is_convertible<decltype(
      std::declval<G&>().read_some(std::declval<std::span<std::byte>>())), IoCount> {};

template <class G, class = void>
struct is_writable_gutter : std::false_type {};

template <class G>
struct is_writable_gutter<G, std::void_t<decltype(
    std::declval<G&>().write_some(std::declval<std::span<const std::byte>>()))>>
  : std::is_convertible<decltype(
      std::declval<G&>().write_some(std::declval<std::span<const std::byte>>())), IoCount> {};

template <class G>
inline constexpr bool is_readable_gutter_v = is_readable_gutter<G>::value;

template <class G>
inline constexpr bool is_writable_gutter_v = is_writable_gutter<G>::value;

template <class G>
inline constexpr bool is_duplex_gutter_v = is_readable_gutter_v<G> && is_writable_gutter_v<G>;

} // namespace gutters::io
