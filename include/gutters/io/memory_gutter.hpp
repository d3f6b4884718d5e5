#pragma once
/**
 * @file memory_gutter.hpp
 * @brief In-memory gutter: reads drain a preset input, writes append to an output.
 *
 * Useful wherever a real descriptor is overkill: unit tests, fixtures, replaying
 * a captured stream. Knobs let callers shape the transport:
 *  - max_chunk: upper bound on bytes moved per read_some/write_some call,
 *    to exercise short reads and short writes.
 *  - fail_reads / fail_writes: every call of that kind returns the given
 *    error until cleared.
 *  - write_capacity: total bytes accepted before write_some returns 0.
 *
 * Not thread-safe.
 */

#include <cstddef>
#include <deque>
#include <limits>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

#include "gutters/io/error.hpp"
#include "gutters/mem/byte_view.hpp"

namespace gutters::io {

class MemoryGutter final {
public:
  MemoryGutter() = default;

  /// @brief Start with @p input queued for reading.
  explicit MemoryGutter(std::span<const std::byte> input);

  /// @brief Queue more bytes for reading.
  void feed(std::span<const std::byte> bytes);

  /// @brief Queue the object representation of a log (test fixture helper).
  template <class T>
  void feed_log(const T& log) {
    feed(mem::as_bytes(log));
  }

  IoCount read_some(std::span<std::byte> buf);
  IoCount write_some(std::span<const std::byte> buf);

  /// @brief Bytes written so far.
  [[nodiscard]] const std::vector<std::byte>& written() const noexcept { return output_; }

  /// @brief Bytes still queued for reading.
  [[nodiscard]] std::size_t pending() const noexcept { return input_.size(); }

  /// @brief Number of read_some/write_some calls made, including failed ones.
  [[nodiscard]] std::size_t read_calls() const noexcept { return read_calls_; }
  [[nodiscard]] std::size_t write_calls() const noexcept { return write_calls_; }

  void set_max_chunk(std::size_t n) noexcept { max_chunk_ = n; }
  void set_write_capacity(std::size_t n) noexcept { write_capacity_ = n; }
  void fail_reads(std::optional<std::error_code> ec) noexcept { read_error_ = ec; }
  void fail_writes(std::optional<std::error_code> ec) noexcept { write_error_ = ec; }

private:
  std::deque<std::byte>          input_{};
  std::vector<std::byte>         output_{};
  std::size_t                    max_chunk_{std::numeric_limits<std::size_t>::max()};
  std::size_t                    write_capacity_{std::numeric_limits<std::size_t>::max()};
  std::optional<std::error_code> read_error_{};
  std::optional<std::error_code> write_error_{};
  std::size_t                    read_calls_{0};
  std::size_t                    write_calls_{0};
};

} // namespace gutters::io
