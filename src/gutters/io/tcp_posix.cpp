#if defined(__linux__) || defined(__APPLE__)

#include "gutters/io/tcp.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace gutters::io {

namespace {

/// Owns a getaddrinfo() result list.
struct AddrInfoList {
  addrinfo* head = nullptr;
  ~AddrInfoList() { if (head) ::freeaddrinfo(head); }
};

std::error_code resolve_error(int rc) noexcept {
  if (rc == EAI_SYSTEM) return last_system_error(errno);
  return make_error_code(GutterError::ResolveFailed);
}

std::error_code resolve(const char* host, std::uint16_t port, bool passive,
                        AddrInfoList& out) {
  addrinfo hints{};
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_family = AF_UNSPEC;
  if (passive) hints.ai_flags = AI_PASSIVE;

  const std::string port_str = std::to_string(port);
  const int rc = ::getaddrinfo(host, port_str.c_str(), &hints, &out.head);
  if (rc != 0 || !out.head) return resolve_error(rc);
  return {};
}

std::uint16_t bound_port(int fd) noexcept {
  sockaddr_storage ss{};
  socklen_t len = sizeof(ss);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&ss), &len) != 0) return 0;
  if (ss.ss_family == AF_INET) {
    return ntohs(reinterpret_cast<const sockaddr_in*>(&ss)->sin_port);
  }
  if (ss.ss_family == AF_INET6) {
    return ntohs(reinterpret_cast<const sockaddr_in6*>(&ss)->sin6_port);
  }
  return 0;
}

} // namespace

gutters_detail::expected<FdGutter, std::error_code>
tcp_connect(const std::string& host, std::uint16_t port) {
  AddrInfoList res;
  if (auto ec = resolve(host.c_str(), port, false, res)) return io_error(ec);

  std::error_code last = make_error_code(GutterError::ResolveFailed);
  for (auto* p = res.head; p; p = p->ai_next) {
    FdGutter sock(::socket(p->ai_family, p->ai_socktype, p->ai_protocol));
    if (!sock.is_open()) { last = last_system_error(errno); continue; }
    if (auto ec = suppress_sigpipe(sock.fd())) { last = ec; continue; }
    if (::connect(sock.fd(), p->ai_addr, p->ai_addrlen) == 0) return sock;
    last = last_system_error(errno);
  }
  return io_error(last);
}

gutters_detail::expected<TcpListener, std::error_code>
TcpListener::bind(const std::string& bind_host, std::uint16_t port) {
  AddrInfoList res;
  if (auto ec = resolve(bind_host.empty() ? nullptr : bind_host.c_str(), port, true, res)) {
    return io_error(ec);
  }

  std::error_code last = make_error_code(GutterError::ResolveFailed);
  for (auto* p = res.head; p; p = p->ai_next) {
    FdGutter sock(::socket(p->ai_family, p->ai_socktype, p->ai_protocol));
    if (!sock.is_open()) { last = last_system_error(errno); continue; }

    int yes = 1;
    if (::setsockopt(sock.fd(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) != 0) {
      last = last_system_error(errno);
      continue;
    }

    if (::bind(sock.fd(), p->ai_addr, p->ai_addrlen) != 0) { last = last_system_error(errno); continue; }
    if (::listen(sock.fd(), 16) != 0) { last = last_system_error(errno); continue; }

    const std::uint16_t actual = bound_port(sock.fd());
    return TcpListener(std::move(sock), actual);
  }
  return io_error(last);
}

gutters_detail::expected<FdGutter, std::error_code> TcpListener::accept() {
  if (!sock_.is_open()) return io_error(make_error_code(GutterError::NotOpen));
  for (;;) {
    const int cfd = ::accept(sock_.fd(), nullptr, nullptr);
    if (cfd >= 0) {
      FdGutter peer(cfd);
      if (auto ec = suppress_sigpipe(peer.fd())) return io_error(ec);
      return peer;
    }
    if (errno != EINTR) return io_error(last_system_error(errno));
  }
}

gutters_detail::expected<FdGutter, std::error_code>
tcp_listen_and_accept(const std::string& bind_host, std::uint16_t port) {
  auto listener = TcpListener::bind(bind_host, port);
  if (!listener) return io_error(listener.error());
  return listener->accept();
}

} // namespace gutters::io
#endif
