#pragma once
#include "qwire.hpp"
#include "transaction.hpp"
#include "util.hpp"
#include <memory>

typedef struct evp_pkey_st EVP_PKEY;

namespace qwire {

// Signing identity. Private material never leaves the implementation.
class KeyPair {
public:
  virtual ~KeyPair() = default;

  virtual PublicKey public_identity() const = 0;
  // Throws SigningError when the backend fails.
  virtual Signature sign(const Digest& digest) const = 0;
};

// Ed25519 over OpenSSL EVP: 32-byte public keys, 64-byte signatures.
class Ed25519KeyPair final : public KeyPair {
public:
  // `private_key` holds the 32-byte Ed25519 seed. SigningError otherwise.
  explicit Ed25519KeyPair(const SecureBytes& private_key);
  ~Ed25519KeyPair() override;

  Ed25519KeyPair(const Ed25519KeyPair&) = delete;
  Ed25519KeyPair& operator=(const Ed25519KeyPair&) = delete;
  Ed25519KeyPair(Ed25519KeyPair&& o) noexcept;
  Ed25519KeyPair& operator=(Ed25519KeyPair&& o) noexcept;

  static std::unique_ptr<Ed25519KeyPair> generate();

  PublicKey public_identity() const override { return public_key_; }
  Signature sign(const Digest& digest) const override;

private:
  EVP_PKEY* pkey_{nullptr};
  PublicKey public_key_{};
};

bool verify_signature(const PublicKey& pk, const Digest& digest, const Signature& sig);

// SHA-256 of the unsigned encoding.
Digest transaction_digest(const Transaction& tx);

// Unsigned -> Signed. SigningError on a null key, a key whose identity is not
// tx.source(), or a backend failure; PreconditionError when already signed.
void sign_transaction(Transaction& tx, const KeyPair* key);
void sign_transaction(Transaction& tx, const KeyPair& key);

// False for unsigned transactions and bad signatures.
bool verify_transaction(const Transaction& tx);

} // namespace qwire
