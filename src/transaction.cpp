#include "qwire/transaction.hpp"
#include "qwire/errors.hpp"
#include "qwire/util.hpp"

#include <string>
#include <utility>

namespace qwire {

void Transaction::write_unsigned(ByteWriter& w) const {
  ensure<FieldOverflow>(input_.size() <= kMaxInputSize,
                        "transaction input of " + std::to_string(input_.size()) +
                            " bytes exceeds 1024");
  w.fixed(source_);
  w.fixed(destination_);
  w.i64(amount_);
  w.u32(tick_);
  w.u16(input_type_);
  w.u16((std::uint16_t)input_.size());
  w.raw(input_);
}

Bytes Transaction::unsigned_bytes() const {
  ByteWriter w(wire_size() - kSignatureLen);
  write_unsigned(w);
  return w.take();
}

void Transaction::write(ByteWriter& w) const {
  write_unsigned(w);
  w.fixed(signature_);
}

Transaction Transaction::read(ByteReader& r) {
  Transaction tx;
  tx.source_ = r.fixed<kPublicKeyLen>();
  tx.destination_ = r.fixed<kPublicKeyLen>();
  tx.amount_ = r.i64();
  tx.tick_ = r.u32();
  tx.input_type_ = r.u16();
  const std::uint16_t input_size = r.u16();
  ensure<MalformedMessage>(input_size <= kMaxInputSize, "transaction input_size above 1024");
  ensure<MalformedMessage>(r.remaining() >= (std::size_t)input_size + kSignatureLen,
                           "transaction input_size disagrees with body length");
  tx.input_ = r.raw(input_size);
  tx.signature_ = r.fixed<kSignatureLen>();
  tx.state_ = is_zero(tx.signature_) ? State::Unsigned : State::Signed;
  return tx;
}

TransactionBuilder TransactionBuilder::from(const Transaction& tx) {
  TransactionBuilder b;
  b.tx_.source_ = tx.source_;
  b.tx_.destination_ = tx.destination_;
  b.tx_.amount_ = tx.amount_;
  b.tx_.tick_ = tx.tick_;
  b.tx_.input_type_ = tx.input_type_;
  b.tx_.input_ = tx.input_;
  return b;
}

TransactionBuilder& TransactionBuilder::input(Bytes data) {
  ensure<FieldOverflow>(data.size() <= kMaxInputSize,
                        "transaction input of " + std::to_string(data.size()) +
                            " bytes exceeds 1024");
  tx_.input_ = std::move(data);
  return *this;
}

} // namespace qwire
