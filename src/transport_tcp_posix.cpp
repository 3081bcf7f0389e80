#include "qwire/transport.hpp"
#include "qwire/errors.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace qwire {

TcpTransport::TcpTransport() = default;
TcpTransport::~TcpTransport() { close(); }

static int remaining_ms(Deadline deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
  if (left.count() <= 0) return 0;
  return (int)left.count();
}

static std::string errno_text(const char* what) {
  return std::string(what) + ": " + std::strerror(errno);
}

static bool set_nonblocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

// Polls `fd` for `events` until the deadline. Returns false on timeout.
static bool poll_until(int fd, short events, Deadline deadline) {
  for (;;) {
    struct pollfd pfd{};
    pfd.fd = fd;
    pfd.events = events;
    int rc = ::poll(&pfd, 1, remaining_ms(deadline));
    if (rc > 0) return true;
    if (rc == 0) {
      if (Clock::now() >= deadline) return false;
      continue;
    }
    if (errno == EINTR) continue;
    throw ConnectionError(errno_text("poll failed"));
  }
}

static int connect_tcp(const std::string& host, std::uint16_t port, Deadline deadline) {
  struct addrinfo hints{};
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_family = AF_UNSPEC;

  struct addrinfo* res = nullptr;
  const std::string port_str = std::to_string(port);
  int rc = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
  ensure<ConnectionError>(rc == 0 && res, "getaddrinfo failed for " + host + ": " +
                                              (rc ? ::gai_strerror(rc) : "no address"));

  int fd = -1;
  std::string last_error = "no usable address";
  bool timed_out = false;
  for (auto* p = res; p; p = p->ai_next) {
    fd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (fd < 0) { last_error = errno_text("socket failed"); continue; }
    if (!set_nonblocking(fd)) {
      last_error = errno_text("fcntl(O_NONBLOCK) failed");
      ::close(fd);
      fd = -1;
      continue;
    }

    if (::connect(fd, p->ai_addr, p->ai_addrlen) == 0) break;
    if (errno == EINPROGRESS) {
      if (!poll_until(fd, POLLOUT, deadline)) {
        timed_out = true;
      } else {
        int err = 0;
        socklen_t len = sizeof(err);
        ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len);
        if (err == 0) break;
        errno = err;
      }
    }
    last_error = timed_out ? std::string("connect timed out") : errno_text("connect failed");
    ::close(fd);
    fd = -1;
    if (timed_out) break;
  }
  ::freeaddrinfo(res);
  ensure<ConnectionError>(fd >= 0, "TCP connect to " + host + ":" + port_str + " failed (" +
                                       last_error + ")");

  int yes = 1;
  ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));
  return fd;
}

static int listen_tcp(const std::string& bind_host, std::uint16_t port) {
  struct addrinfo hints{};
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_family = AF_UNSPEC;
  hints.ai_flags = AI_PASSIVE;

  const std::string port_str = std::to_string(port);
  const std::string where = (bind_host.empty() ? std::string("*") : bind_host) + ":" + port_str;
  struct addrinfo* res = nullptr;
  int rc = ::getaddrinfo(bind_host.empty() ? nullptr : bind_host.c_str(), port_str.c_str(),
                         &hints, &res);
  ensure<ConnectionError>(rc == 0 && res, "getaddrinfo failed for " + where + ": " +
                                              (rc ? ::gai_strerror(rc) : "no address"));

  int lfd = -1;
  std::string last_error = "no usable address";
  for (auto* p = res; p; p = p->ai_next) {
    lfd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (lfd < 0) { last_error = errno_text("socket failed"); continue; }

    int yes = 1;
    ::setsockopt(lfd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    if (::bind(lfd, p->ai_addr, p->ai_addrlen) == 0 && ::listen(lfd, 16) == 0) break;
    last_error = errno_text("bind/listen failed");
    ::close(lfd);
    lfd = -1;
  }
  ::freeaddrinfo(res);
  ensure<ConnectionError>(lfd >= 0, "TCP listen on " + where + " failed (" + last_error + ")");
  return lfd;
}

static std::uint16_t bound_port(int fd) {
  struct sockaddr_storage ss{};
  socklen_t len = sizeof(ss);
  ensure<ConnectionError>(::getsockname(fd, (struct sockaddr*)&ss, &len) == 0,
                          errno_text("getsockname failed"));
  if (ss.ss_family == AF_INET6) return ntohs(((struct sockaddr_in6*)&ss)->sin6_port);
  return ntohs(((struct sockaddr_in*)&ss)->sin_port);
}

void TcpTransport::connect(const std::string& host, std::uint16_t port, Deadline deadline) {
  close();
  const int fd = connect_tcp(host, port, deadline);
  std::lock_guard<std::mutex> lk(fd_mutex_);
  fd_ = fd;
}

std::uint16_t TcpTransport::listen(const std::string& bind_host, std::uint16_t port) {
  close();
  listen_fd_ = listen_tcp(bind_host, port);
  return bound_port(listen_fd_);
}

void TcpTransport::accept_one(Deadline deadline) {
  ensure<ConnectionError>(listen_fd_ >= 0, "accept without listen");
  ensure<Timeout>(poll_until(listen_fd_, POLLIN, deadline), "accept timed out");
  int cfd = ::accept(listen_fd_, nullptr, nullptr);
  ensure<ConnectionError>(cfd >= 0, errno_text("accept failed"));
  if (!set_nonblocking(cfd)) {
    ::close(cfd);
    throw ConnectionError(errno_text("fcntl(O_NONBLOCK) failed"));
  }
  int yes = 1;
  ::setsockopt(cfd, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));
  std::lock_guard<std::mutex> lk(fd_mutex_);
  fd_ = cfd;
  ::close(listen_fd_);
  listen_fd_ = -1;
}

bool TcpTransport::wait_readable(Deadline deadline) {
  ensure<ConnectionClosed>(fd_ >= 0, "wait on closed socket");
  return poll_until(fd_, POLLIN, deadline);
}

void TcpTransport::send_all(const std::uint8_t* data, std::size_t n, Deadline deadline) {
  ensure<ConnectionClosed>(fd_ >= 0, "send on closed socket");
  std::size_t off = 0;
  while (off < n) {
    ssize_t w = ::send(fd_, data + off, n - off, MSG_NOSIGNAL);
    if (w > 0) { off += (std::size_t)w; continue; }
    if (w < 0 && errno == EINTR) continue;
    if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      ensure<Timeout>(poll_until(fd_, POLLOUT, deadline), "send timed out");
      continue;
    }
    if (w < 0 && (errno == EPIPE || errno == ECONNRESET))
      throw ConnectionError(errno_text("broken pipe"));
    throw ConnectionError(errno_text("send failed"));
  }
}

void TcpTransport::recv_all(std::uint8_t* out, std::size_t n, Deadline deadline) {
  ensure<ConnectionClosed>(fd_ >= 0, "recv on closed socket");
  std::size_t off = 0;
  while (off < n) {
    ssize_t r = ::recv(fd_, out + off, n - off, 0);
    if (r > 0) { off += (std::size_t)r; continue; }
    if (r == 0) throw ConnectionClosed("peer closed the connection");
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      ensure<Timeout>(poll_until(fd_, POLLIN, deadline), "recv timed out");
      continue;
    }
    if (errno == ECONNRESET) throw ConnectionClosed(errno_text("connection reset"));
    throw ConnectionError(errno_text("recv failed"));
  }
}

void TcpTransport::shutdown() noexcept {
  std::lock_guard<std::mutex> lk(fd_mutex_);
  if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
}

void TcpTransport::close() noexcept {
  std::lock_guard<std::mutex> lk(fd_mutex_);
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
  if (listen_fd_ >= 0) { ::close(listen_fd_); listen_fd_ = -1; }
}

} // namespace qwire
