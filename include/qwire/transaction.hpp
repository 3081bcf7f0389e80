#pragma once
#include "qwire.hpp"
#include "codec.hpp"
#include "messages.hpp"
#include <cstdint>

namespace qwire {

class KeyPair;
class Transaction;

void sign_transaction(Transaction& tx, const KeyPair* key);

// Transfer (plus optional contract input) as broadcast on the wire:
// [src:32][dst:32][amount:i64][tick:u32][input_type:u16][input_size:u16]
// [input][signature:64]
class Transaction {
public:
  static constexpr MessageType kType = MessageType::BroadcastTransaction;
  static constexpr std::size_t kMinSize = 2 * kPublicKeyLen + 8 + 4 + 2 + 2 + kSignatureLen;

  enum class State : std::uint8_t { Unsigned, Signed };

  Transaction() = default;

  const PublicKey& source() const { return source_; }
  const PublicKey& destination() const { return destination_; }
  std::int64_t amount() const { return amount_; }
  std::uint32_t tick() const { return tick_; }
  std::uint16_t input_type() const { return input_type_; }
  std::uint16_t input_size() const { return (std::uint16_t)input_.size(); }
  const Bytes& input() const { return input_; }
  const Signature& signature() const { return signature_; }
  State state() const { return state_; }
  bool is_signed() const { return state_ == State::Signed; }

  // Canonical encoding of every field except the signature.
  Bytes unsigned_bytes() const;
  std::size_t wire_size() const { return kMinSize + input_.size(); }

  void write(ByteWriter& w) const;
  // A non-zero signature marks the decoded transaction as Signed.
  static Transaction read(ByteReader& r);

private:
  friend class TransactionBuilder;
  friend void sign_transaction(Transaction& tx, const KeyPair* key);

  void write_unsigned(ByteWriter& w) const;

  PublicKey source_{};
  PublicKey destination_{};
  std::int64_t amount_{0};
  std::uint32_t tick_{0};
  std::uint16_t input_type_{0};
  Bytes input_;
  Signature signature_{};
  State state_{State::Unsigned};
};

class TransactionBuilder {
public:
  TransactionBuilder() = default;

  // Unsigned copy of `tx`'s fields.
  static TransactionBuilder from(const Transaction& tx);

  TransactionBuilder& source(const PublicKey& pk) { tx_.source_ = pk; return *this; }
  TransactionBuilder& destination(const PublicKey& pk) { tx_.destination_ = pk; return *this; }
  TransactionBuilder& amount(std::int64_t v) { tx_.amount_ = v; return *this; }
  TransactionBuilder& tick(std::uint32_t v) { tx_.tick_ = v; return *this; }
  TransactionBuilder& input_type(std::uint16_t v) { tx_.input_type_ = v; return *this; }
  // Throws FieldOverflow above kMaxInputSize bytes.
  TransactionBuilder& input(Bytes data);

  Transaction build() const { return tx_; }

private:
  Transaction tx_;
};

} // namespace qwire
