#pragma once
#include "qwire.hpp"
#include "errors.hpp"
#include "messages.hpp"
#include "transport.hpp"
#include <cstdint>
#include <string>

namespace qwire {

// 8-byte little-endian header: [size:3][type:1][dejavu:4]. `size` counts the
// header itself.
static constexpr std::size_t kHeaderSize = 8;
static constexpr std::uint32_t kMaxMessageSize = 0xFFFFFF;

struct MessageHeader {
  std::uint32_t size{kHeaderSize};
  std::uint8_t type{0};
  std::uint32_t dejavu{0};

  std::size_t body_size() const { return size - kHeaderSize; }

  void write(ByteWriter& w) const;
  // Throws MalformedMessage when size is below the header size.
  static MessageHeader read(ByteReader& r);
};

struct WireMessage {
  MessageHeader header;
  Bytes body;

  MessageType type() const { return (MessageType)header.type; }
  std::uint32_t dejavu() const { return header.dejavu; }
};

// Throws FieldOverflow when header + body exceeds kMaxMessageSize.
WireMessage make_message(MessageType type, std::uint32_t dejavu, Bytes body);

template <typename T>
WireMessage make_message(std::uint32_t dejavu, const T& v) {
  return make_message(T::kType, dejavu, serialize(v));
}

// Header and body concatenated, ready for a single write.
Bytes encode_message(const WireMessage& msg);

// Sends one message as a single contiguous write.
void send_msg(ITransport& t, const WireMessage& msg, Deadline deadline);

// Receives exactly one message: header first, then size - 8 body bytes.
WireMessage recv_msg(ITransport& t, Deadline deadline);

// Decodes a message body as T, checking the type and the exact length.
template <typename T>
T decode_body(const WireMessage& msg) {
  if (msg.type() != T::kType)
    throw MalformedMessage(std::string("expected ") + message_type_name(T::kType) + ", got " +
                           message_type_name(msg.type()));
  if (msg.body.size() != T::kSize)
    throw MalformedMessage(std::string(message_type_name(T::kType)) + " body is " +
                           std::to_string(msg.body.size()) + " bytes, expected " +
                           std::to_string(T::kSize));
  return parse<T>(msg.body);
}

} // namespace qwire
