#pragma once
#include <stdexcept>
#include <string>

namespace qwire {

// Root of everything the library throws.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Transport faults: the caller may reconnect and reissue.
class TransportError : public Error {
public:
  using Error::Error;
};

// Cannot establish or maintain the TCP stream.
class ConnectionError final : public TransportError {
public:
  using TransportError::TransportError;
};

// Peer closed, or the connection was closed locally, mid-operation.
class ConnectionClosed final : public TransportError {
public:
  using TransportError::TransportError;
};

// Deadline elapsed awaiting bytes, a write, or a correlated response.
class Timeout final : public TransportError {
public:
  using TransportError::TransportError;
};

// Structural violations of the wire format. Not retryable.
class ProtocolError : public Error {
public:
  using Error::Error;
};

class MalformedMessage final : public ProtocolError {
public:
  using ProtocolError::ProtocolError;
};

class FieldOverflow final : public ProtocolError {
public:
  using ProtocolError::ProtocolError;
};

// Caller logic error, detected before any I/O.
class PreconditionError final : public Error {
public:
  using Error::Error;
};

// Key material missing or unusable.
class SigningError final : public Error {
public:
  using Error::Error;
};

template <typename E = Error>
inline void ensure(bool ok, const char* msg) {
  if (!ok) throw E(msg);
}

template <typename E = Error>
inline void ensure(bool ok, const std::string& msg) {
  if (!ok) throw E(msg);
}

} // namespace qwire
