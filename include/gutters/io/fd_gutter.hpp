#pragma once
/**
 * @file fd_gutter.hpp
 * @brief Owning POSIX file-descriptor gutter (sockets, pipes, files).
 * @note POSIX only (Linux/macOS). See fd_gutter_posix.cpp.
 */

#include <cstddef>
#include <span>
#include <utility>

#include "gutters/io/error.hpp"

namespace gutters::io {

/** @class FdGutter
 *  @brief Move-only RAII owner of one file descriptor; readable and writable.
 *
 *  read_some() maps to read(2). write_some() uses send(2) on sockets and
 *  write(2) on anything else. Either way a vanished reader yields EPIPE
 *  (std::errc::broken_pipe), never SIGPIPE: sockets pass MSG_NOSIGNAL (or
 *  carry SO_NOSIGPIPE), and write(2) runs with SIGPIPE blocked for the
 *  calling thread. No process-wide signal disposition is touched.
 */
class FdGutter final {
public:
  FdGutter() noexcept = default;

  /// @brief Take ownership of @p fd (closed on destruction).
  explicit FdGutter(int fd) noexcept : fd_(fd) {}

  ~FdGutter();

  FdGutter(const FdGutter&)            = delete;
  FdGutter& operator=(const FdGutter&) = delete;

  FdGutter(FdGutter&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
  FdGutter& operator=(FdGutter&& other) noexcept;

  /// @brief Blocking read of up to buf.size() bytes. 0 means end of stream.
  IoCount read_some(std::span<std::byte> buf);

  /// @brief Blocking write of up to buf.size() bytes.
  IoCount write_some(std::span<const std::byte> buf);

  /// @brief Half-close the write direction (sockets only); the peer sees EOF.
  IoResult shutdown_write();

  /// @brief Close the descriptor. Safe to call more than once.
  void close() noexcept;

  /// @brief Give up ownership and return the descriptor (-1 if closed).
  [[nodiscard]] int release() noexcept { return std::exchange(fd_, -1); }

  [[nodiscard]] int fd() const noexcept { return fd_; }
  [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

private:
  int fd_{-1};
};

/// @brief Two connected ends of an AF_UNIX stream socket (in-process duplex pipe).
struct GutterPair {
  FdGutter first;
  FdGutter second;
};

/// @brief Create a connected socket pair.
gutters_detail::expected<GutterPair, std::error_code> make_socket_pair();

/// @brief Set SO_NOSIGPIPE on a socket where the platform has it; no-op elsewhere.
std::error_code suppress_sigpipe(int fd) noexcept;

/// @brief Create a unidirectional pipe. `first` reads, `second` writes.
gutters_detail::expected<GutterPair, std::error_code> make_pipe();

} // namespace gutters::io
