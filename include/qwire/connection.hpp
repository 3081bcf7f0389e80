#pragma once
#include "framing.hpp"
#include "transport.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace qwire {

// One TCP stream to a node. Owns its transport; the socket is released
// exactly once, on the first of close(), destruction, or an irrecoverable
// I/O failure.
class Connection {
public:
  explicit Connection(std::unique_ptr<ITransport> transport);
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // Only valid on a fresh connection. ConnectionError on DNS failure,
  // refusal or timeout.
  void connect(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout);

  void send(const WireMessage& msg, Deadline deadline);

  // Timeout before the first byte keeps the connection open. Any failure
  // after that releases the socket.
  WireMessage receive_one_message(Deadline deadline);

  // Idempotent. Wakes a reader blocked in receive_one_message().
  void close() noexcept;

  bool is_open() const { return state_.load() == State::Open; }

private:
  enum class State : std::uint8_t { Idle, Open, Closed };

  void check_open() const;
  void release_locked() noexcept;

  std::unique_ptr<ITransport> t_;
  std::atomic<State> state_{State::Idle};
  std::mutex io_mutex_;
  bool released_{false};
  std::string peer_;
};

} // namespace qwire
