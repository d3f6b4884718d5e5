#pragma once
/**
 * @file error.hpp
 * @brief Error codes added by gutters on top of the transport's own errors.
 *
 * Transport failures travel unchanged as std::error_code (errno values in
 * std::system_category). GutterError lists the few conditions gutters
 * raises itself; they live in their own category.
 */

#include <cstddef>
#include <cstdint>
#include <system_error>
#include <type_traits>

#include "gutters/compat/expected.hpp"  // gutters_detail::expected / unexpected

namespace gutters {

/// @brief Conditions raised by gutters itself (category "gutters").
enum class GutterError : std::uint8_t {
  UnexpectedEof = 1,  ///< Stream ended before the requested byte count
  WriteZero,          ///< Gutter accepted zero bytes of a non-empty write
  NotOpen,            ///< Operation on a closed gutter
  ResolveFailed       ///< Host/port lookup failed during TCP setup
};

/// @brief Category for GutterError values.
const std::error_category& gutter_category() noexcept;

/// @brief Enables `std::error_code ec = GutterError::UnexpectedEof;`.
std::error_code make_error_code(GutterError e) noexcept;

/// @brief Result of a primitive: nothing on success, the first error otherwise.
using IoResult = gutters_detail::expected<void, std::error_code>;

/// @brief Result of a single read_some/write_some call: bytes transferred.
using IoCount = gutters_detail::expected<std::size_t, std::error_code>;

/// @brief Shorthand for building the error branch of IoResult/IoCount.
inline gutters_detail::unexpected<std::error_code> io_error(std::error_code ec) noexcept {
  return gutters_detail::unexpected<std::error_code>(ec);
}

/// @brief errno captured as a system error_code.
inline std::error_code last_system_error(int err) noexcept {
  return std::error_code(err, std::system_category());
}

} // namespace gutters

namespace std {
template <>
struct is_error_code_enum<gutters::GutterError> : true_type {};
} // namespace std
