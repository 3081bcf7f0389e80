#include "qwire/framing.hpp"
#include "qwire/errors.hpp"

#include <string>
#include <utility>

namespace qwire {

void MessageHeader::write(ByteWriter& w) const {
  w.u8((std::uint8_t)(size & 0xFF));
  w.u8((std::uint8_t)((size >> 8) & 0xFF));
  w.u8((std::uint8_t)((size >> 16) & 0xFF));
  w.u8(type);
  w.u32(dejavu);
}

MessageHeader MessageHeader::read(ByteReader& r) {
  MessageHeader h;
  std::uint32_t b0 = r.u8();
  std::uint32_t b1 = r.u8();
  std::uint32_t b2 = r.u8();
  h.size = b0 | (b1 << 8) | (b2 << 16);
  h.type = r.u8();
  h.dejavu = r.u32();
  ensure<MalformedMessage>(h.size >= kHeaderSize,
                           "header size " + std::to_string(h.size) + " below header length");
  return h;
}

WireMessage make_message(MessageType type, std::uint32_t dejavu, Bytes body) {
  ensure<FieldOverflow>(body.size() <= kMaxMessageSize - kHeaderSize,
                        "message body of " + std::to_string(body.size()) +
                            " bytes exceeds the 24-bit size field");
  WireMessage msg;
  msg.header.size = (std::uint32_t)(kHeaderSize + body.size());
  msg.header.type = (std::uint8_t)type;
  msg.header.dejavu = dejavu;
  msg.body = std::move(body);
  return msg;
}

Bytes encode_message(const WireMessage& msg) {
  ensure<FieldOverflow>(msg.header.size <= kMaxMessageSize, "frame too large");
  ensure<FieldOverflow>(msg.header.size == kHeaderSize + msg.body.size(),
                        "header size disagrees with body length");
  ByteWriter w(msg.header.size);
  msg.header.write(w);
  w.raw(msg.body);
  return w.take();
}

void send_msg(ITransport& t, const WireMessage& msg, Deadline deadline) {
  const Bytes wire = encode_message(msg);
  t.send_all(wire.data(), wire.size(), deadline);
}

WireMessage recv_msg(ITransport& t, Deadline deadline) {
  std::uint8_t hdr[kHeaderSize];
  t.recv_all(hdr, kHeaderSize, deadline);
  ByteReader r(hdr, kHeaderSize);
  WireMessage msg;
  msg.header = MessageHeader::read(r);
  msg.body.resize(msg.header.body_size());
  if (!msg.body.empty()) t.recv_all(msg.body.data(), msg.body.size(), deadline);
  return msg;
}

} // namespace qwire
