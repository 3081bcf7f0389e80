#include "qwire/signer.hpp"
#include "qwire/errors.hpp"

#include <openssl/evp.h>

#include <memory>
#include <utility>

namespace qwire {

// ------------------------------ EVP helpers ------------------------------

struct EvpMdCtxFree {
  void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); }
};
struct EvpPkeyFree {
  void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxFree>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyFree>;

// ------------------------------ Ed25519 ------------------------------

Ed25519KeyPair::Ed25519KeyPair(const SecureBytes& private_key) {
  ensure<SigningError>(private_key.b.size() == 32, "Ed25519 private key must be 32 bytes");
  PkeyPtr pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                            private_key.b.data(), private_key.b.size()));
  ensure<SigningError>(pkey != nullptr, "EVP_PKEY_new_raw_private_key failed");

  std::size_t len = public_key_.size();
  ensure<SigningError>(EVP_PKEY_get_raw_public_key(pkey.get(), public_key_.data(), &len) == 1 &&
                           len == kPublicKeyLen,
                       "EVP_PKEY_get_raw_public_key failed");
  pkey_ = pkey.release();
}

Ed25519KeyPair::~Ed25519KeyPair() { EVP_PKEY_free(pkey_); }

Ed25519KeyPair::Ed25519KeyPair(Ed25519KeyPair&& o) noexcept
  : pkey_(o.pkey_), public_key_(o.public_key_) {
  o.pkey_ = nullptr;
}

Ed25519KeyPair& Ed25519KeyPair::operator=(Ed25519KeyPair&& o) noexcept {
  if (this != &o) {
    EVP_PKEY_free(pkey_);
    pkey_ = o.pkey_;
    public_key_ = o.public_key_;
    o.pkey_ = nullptr;
  }
  return *this;
}

std::unique_ptr<Ed25519KeyPair> Ed25519KeyPair::generate() {
  SecureBytes seed(32);
  rand_bytes(seed.b.data(), seed.b.size());
  return std::unique_ptr<Ed25519KeyPair>(new Ed25519KeyPair(seed));
}

Signature Ed25519KeyPair::sign(const Digest& digest) const {
  ensure<SigningError>(pkey_ != nullptr, "key pair has been moved from");
  MdCtxPtr ctx(EVP_MD_CTX_new());
  ensure<SigningError>(ctx != nullptr, "EVP_MD_CTX_new failed");
  ensure<SigningError>(EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey_) == 1,
                       "EVP_DigestSignInit failed");

  Signature sig{};
  std::size_t siglen = sig.size();
  ensure<SigningError>(EVP_DigestSign(ctx.get(), sig.data(), &siglen, digest.data(),
                                      digest.size()) == 1,
                       "EVP_DigestSign failed");
  ensure<SigningError>(siglen == kSignatureLen, "unexpected signature length");
  return sig;
}

bool verify_signature(const PublicKey& pk, const Digest& digest, const Signature& sig) {
  PkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, pk.data(), pk.size()));
  if (!pkey) return false;
  MdCtxPtr ctx(EVP_MD_CTX_new());
  ensure<SigningError>(ctx != nullptr, "EVP_MD_CTX_new failed");
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) return false;
  return EVP_DigestVerify(ctx.get(), sig.data(), sig.size(), digest.data(), digest.size()) == 1;
}

// ------------------------------ Transactions ------------------------------

Digest transaction_digest(const Transaction& tx) { return sha256(tx.unsigned_bytes()); }

void sign_transaction(Transaction& tx, const KeyPair* key) {
  ensure<SigningError>(key != nullptr, "no key pair supplied");
  ensure<PreconditionError>(!tx.is_signed(), "transaction is already signed");

  const PublicKey identity = key->public_identity();
  ensure<SigningError>(!is_zero(identity), "key pair yields an empty identity");
  ensure<SigningError>(identity == tx.source(),
                       "transaction source does not match the signing identity");

  const Digest digest = transaction_digest(tx);
  const Signature sig = key->sign(digest);
  ensure<SigningError>(!is_zero(sig), "key pair produced an empty signature");

  tx.signature_ = sig;
  tx.state_ = Transaction::State::Signed;
}

void sign_transaction(Transaction& tx, const KeyPair& key) { sign_transaction(tx, &key); }

bool verify_transaction(const Transaction& tx) {
  if (!tx.is_signed()) return false;
  return verify_signature(tx.source(), transaction_digest(tx), tx.signature());
}

} // namespace qwire
