#if defined(__linux__) || defined(__APPLE__)

#include "gutters/io/fd_gutter.hpp"

#include <cerrno>
#include <csignal>
#include <ctime>
#include <fcntl.h>
#include <pthread.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace gutters::io {

#if defined(MSG_NOSIGNAL)
static constexpr int kSendFlags = MSG_NOSIGNAL;
#else
static constexpr int kSendFlags = 0;
#endif

static std::error_code not_open() noexcept {
  return make_error_code(GutterError::NotOpen);
}

/// write(2) with SIGPIPE blocked on the calling thread. A SIGPIPE raised by
/// this write is consumed before the old mask returns, so the caller sees
/// EPIPE only. errno is preserved across the mask restore.
static ssize_t write_without_sigpipe(int fd, const void* data, std::size_t len) {
#if defined(__linux__)
  sigset_t pipe_set;
  sigemptyset(&pipe_set);
  sigaddset(&pipe_set, SIGPIPE);

  // A SIGPIPE already pending for this thread belongs to someone else.
  sigset_t pending;
  sigemptyset(&pending);
  const bool was_pending = ::sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1;

  sigset_t old_mask;
  if (const int rc = ::pthread_sigmask(SIG_BLOCK, &pipe_set, &old_mask); rc != 0) {
    errno = rc;
    return -1;
  }

  const ssize_t w = ::write(fd, data, len);
  const int saved = errno;

  if (w < 0 && saved == EPIPE && !was_pending) {
    const timespec zero{0, 0};
    while (::sigtimedwait(&pipe_set, nullptr, &zero) < 0 && errno == EINTR) {}
  }

  ::pthread_sigmask(SIG_SETMASK, &old_mask, nullptr);
  errno = saved;
  return w;
#else
  // Pipes from make_pipe() carry F_SETNOSIGPIPE here.
  return ::write(fd, data, len);
#endif
}

FdGutter::~FdGutter() { close(); }

FdGutter& FdGutter::operator=(FdGutter&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

IoCount FdGutter::read_some(std::span<std::byte> buf) {
  if (fd_ < 0) return io_error(not_open());
  const ssize_t r = ::read(fd_, buf.data(), buf.size());
  if (r < 0) return io_error(last_system_error(errno));
  return static_cast<std::size_t>(r);
}

IoCount FdGutter::write_some(std::span<const std::byte> buf) {
  if (fd_ < 0) return io_error(not_open());
  ssize_t w = ::send(fd_, buf.data(), buf.size(), kSendFlags);
  if (w < 0 && errno == ENOTSOCK) {
    // Pipe or regular file.
    w = write_without_sigpipe(fd_, buf.data(), buf.size());
  }
  if (w < 0) return io_error(last_system_error(errno));
  return static_cast<std::size_t>(w);
}

IoResult FdGutter::shutdown_write() {
  if (fd_ < 0) return io_error(not_open());
  if (::shutdown(fd_, SHUT_WR) != 0) return io_error(last_system_error(errno));
  return {};
}

void FdGutter::close() noexcept {
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

std::error_code suppress_sigpipe(int fd) noexcept {
#if defined(SO_NOSIGPIPE)
  int yes = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &yes, sizeof(yes)) != 0) {
    return last_system_error(errno);
  }
#else
  (void)fd;
#endif
  return {};
}

gutters_detail::expected<GutterPair, std::error_code> make_socket_pair() {
  int fds[2] = {-1, -1};
  if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
    return io_error(last_system_error(errno));
  }
  GutterPair pair{FdGutter(fds[0]), FdGutter(fds[1])};
  if (auto ec = suppress_sigpipe(pair.first.fd())) return io_error(ec);
  if (auto ec = suppress_sigpipe(pair.second.fd())) return io_error(ec);
  return pair;
}

gutters_detail::expected<GutterPair, std::error_code> make_pipe() {
  int fds[2] = {-1, -1};
  if (::pipe(fds) != 0) {
    return io_error(last_system_error(errno));
  }
  GutterPair pair{FdGutter(fds[0]), FdGutter(fds[1])};
#if defined(F_SETNOSIGPIPE)
  if (::fcntl(pair.second.fd(), F_SETNOSIGPIPE, 1) != 0) {
    return io_error(last_system_error(errno));
  }
#endif
  return pair;
}

} // namespace gutters::io
#endif
