#pragma once
#include "qwire.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

namespace qwire {

using Clock = std::chrono::steady_clock;
using Deadline = Clock::time_point;

inline Deadline deadline_after(std::chrono::milliseconds ms) { return Clock::now() + ms; }

// Byte stream with deadlines. Errors are reported as ConnectionError,
// ConnectionClosed or Timeout.
class ITransport {
public:
  virtual ~ITransport() = default;

  virtual void connect(const std::string& host, std::uint16_t port, Deadline deadline) = 0;

  // True once at least one byte (or EOF) is pending. False on deadline.
  virtual bool wait_readable(Deadline deadline) = 0;

  virtual void send_all(const std::uint8_t* data, std::size_t n, Deadline deadline) = 0;
  virtual void recv_all(std::uint8_t* out, std::size_t n, Deadline deadline) = 0;

  // Wakes up blocked readers/writers without releasing the descriptor.
  // Safe to call from another thread, concurrently with close().
  virtual void shutdown() noexcept = 0;
  virtual void close() noexcept = 0;
};

// POSIX TCP transport (Linux/macOS)
class TcpTransport final : public ITransport {
public:
  TcpTransport();
  ~TcpTransport() override;

  TcpTransport(const TcpTransport&) = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;

  void connect(const std::string& host, std::uint16_t port, Deadline deadline) override;

  // Server side: bind and listen, returning the bound port (useful with port 0).
  std::uint16_t listen(const std::string& bind_host, std::uint16_t port);
  // Accepts one client; the listening socket is released afterwards.
  void accept_one(Deadline deadline);

  bool wait_readable(Deadline deadline) override;

  void send_all(const std::uint8_t* data, std::size_t n, Deadline deadline) override;
  void recv_all(std::uint8_t* out, std::size_t n, Deadline deadline) override;

  void shutdown() noexcept override;
  void close() noexcept override;

private:
  // Guards descriptor changes against a concurrent shutdown().
  std::mutex fd_mutex_;
  int fd_{-1};
  int listen_fd_{-1};
};

} // namespace qwire
