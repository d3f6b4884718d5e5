#pragma once
/**
 * @file tcp.hpp
 * @brief Blocking TCP setup that hands back FdGutter ends.
 * @details Connection management stops here: once a gutter is returned the
 *          primitives own the conversation, and closing is RAII.
 */

#include <cstdint>
#include <string>

#include "gutters/io/error.hpp"
#include "gutters/io/fd_gutter.hpp"

namespace gutters::io {

/// @brief Resolve @p host and connect to the first address that accepts.
gutters_detail::expected<FdGutter, std::error_code>
tcp_connect(const std::string& host, std::uint16_t port);

/** @class TcpListener
 *  @brief Owns a listening socket; accept() yields one FdGutter per peer.
 */
class TcpListener final {
public:
  /// @brief Bind and listen. Empty @p bind_host means any address; port 0 picks one.
  static gutters_detail::expected<TcpListener, std::error_code>
  bind(const std::string& bind_host, std::uint16_t port);

  TcpListener(const TcpListener&)            = delete;
  TcpListener& operator=(const TcpListener&) = delete;
  TcpListener(TcpListener&&) noexcept            = default;
  TcpListener& operator=(TcpListener&&) noexcept = default;

  /// @brief Block until a peer connects.
  gutters_detail::expected<FdGutter, std::error_code> accept();

  /// @brief Port actually bound (resolves port 0).
  [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

private:
  TcpListener(FdGutter sock, std::uint16_t port) noexcept
    : sock_(std::move(sock)), port_(port) {}

  FdGutter      sock_{};
  std::uint16_t port_{0};
};

/// @brief Bind, listen, accept exactly one peer and drop the listener.
gutters_detail::expected<FdGutter, std::error_code>
tcp_listen_and_accept(const std::string& bind_host, std::uint16_t port);

} // namespace gutters::io
