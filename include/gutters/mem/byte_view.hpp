/**
 * @file byte_view.hpp
 * @brief Fixed-length std::byte views over a log's storage (no copy).
 *
 * A "log" is any value whose object representation can be moved across a
 * gutter byte for byte. The views below alias the value: writing through
 * as_writable_bytes() mutates the value in place, and the view length is
 * always exactly sizeof(T).
 *
 * Byte order and padding are not touched. Both peers must agree on the
 * layout of T out of band.
 *
 * @tparam T Log type. Must satisfy LogTraits<T>::ok.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <type_traits>

namespace gutters::mem {

/// @brief Trait constraining log types to plain, self-contained storage.
///
/// Pointers of any kind are rejected since the address would be meaningless
/// to the peer. Pointers nested inside a struct cannot be detected; keeping
/// them out is the caller's contract.
template <class T>
struct LogTraits {
  static constexpr bool ok =
    std::is_trivially_copyable_v<T> &&
    !std::is_pointer_v<std::remove_all_extents_t<T>> &&
    !std::is_member_pointer_v<std::remove_all_extents_t<T>> &&
    !std::is_null_pointer_v<std::remove_all_extents_t<T>> &&
    !std::is_volatile_v<T>;
};

template <class T>
inline constexpr bool is_log_v = LogTraits<std::remove_const_t<T>>::ok;

/// @brief Read-only view over the bytes of @p log (outgoing data).
template <class T>
std::span<const std::byte, sizeof(T)> as_bytes(const T& log) noexcept {
  static_assert(is_log_v<T>,
                "gutters: log type must be trivially copyable and hold no pointers");
  return std::span<const std::byte, sizeof(T)>(
    reinterpret_cast<const std::byte*>(std::addressof(log)), sizeof(T));
}

/// @brief Mutable view over the bytes of @p log (incoming data).
template <class T>
std::span<std::byte, sizeof(T)> as_writable_bytes(T& log) noexcept {
  static_assert(!std::is_const_v<T>, "gutters: cannot pick up into a const log");
  static_assert(is_log_v<T>,
                "gutters: log type must be trivially copyable and hold no pointers");
  return std::span<std::byte, sizeof(T)>(
    reinterpret_cast<std::byte*>(std::addressof(log)), sizeof(T));
}

} // namespace gutters::mem
