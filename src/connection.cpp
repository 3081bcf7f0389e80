#include "qwire/connection.hpp"
#include "qwire/errors.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace qwire {

Connection::Connection(std::unique_ptr<ITransport> transport) : t_(std::move(transport)) {
  ensure<PreconditionError>(t_ != nullptr, "connection needs a transport");
}

Connection::~Connection() { close(); }

void Connection::connect(const std::string& host, std::uint16_t port,
                         std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lk(io_mutex_);
  ensure<PreconditionError>(state_.load() == State::Idle, "connection already used");
  peer_ = host + ":" + std::to_string(port);
  try {
    t_->connect(host, port, deadline_after(timeout));
  } catch (const std::exception& e) {
    state_.store(State::Closed);
    release_locked();
    spdlog::warn("[conn] connect to {} failed: {}", peer_, e.what());
    throw;
  }
  state_.store(State::Open);
  spdlog::debug("[conn] connected to {}", peer_);
}

void Connection::check_open() const {
  const State s = state_.load();
  ensure<PreconditionError>(s != State::Idle, "connection not established");
  ensure<ConnectionClosed>(s == State::Open, "connection is closed");
}

void Connection::send(const WireMessage& msg, Deadline deadline) {
  std::lock_guard<std::mutex> lk(io_mutex_);
  check_open();
  const Bytes wire = encode_message(msg);
  try {
    t_->send_all(wire.data(), wire.size(), deadline);
  } catch (const TransportError& e) {
    spdlog::warn("[conn] send to {} failed, closing: {}", peer_, e.what());
    state_.store(State::Closed);
    release_locked();
    throw;
  }
}

WireMessage Connection::receive_one_message(Deadline deadline) {
  std::lock_guard<std::mutex> lk(io_mutex_);
  check_open();

  bool readable = false;
  try {
    readable = t_->wait_readable(deadline);
  } catch (const TransportError&) {
    state_.store(State::Closed);
    release_locked();
    throw;
  }
  if (!readable) throw Timeout("no message from " + peer_ + " before the deadline");
  // close() may have shut the socket down while we were waiting.
  ensure<ConnectionClosed>(state_.load() == State::Open, "connection closed while waiting");

  try {
    return recv_msg(*t_, deadline);
  } catch (const Error& e) {
    spdlog::warn("[conn] framing failure on {}, closing: {}", peer_, e.what());
    state_.store(State::Closed);
    release_locked();
    throw;
  }
}

void Connection::close() noexcept {
  const State prev = state_.exchange(State::Closed);
  if (prev == State::Open) t_->shutdown();
  std::lock_guard<std::mutex> lk(io_mutex_);
  if (!released_ && prev == State::Open) spdlog::debug("[conn] closing {}", peer_);
  release_locked();
}

void Connection::release_locked() noexcept {
  if (released_) return;
  released_ = true;
  t_->close();
}

} // namespace qwire
