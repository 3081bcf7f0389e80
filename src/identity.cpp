#include "qwire/identity.hpp"
#include "qwire/errors.hpp"
#include "qwire/util.hpp"

#include <limits>

namespace qwire {

static constexpr std::size_t kGroupLetters = 14;
static constexpr std::size_t kChecksumLetters = 4;

static std::string checksum_letters(const PublicKey& pk) {
  const Digest h = sha256(pk.data(), pk.size());
  std::uint32_t c = ((std::uint32_t)h[0] | ((std::uint32_t)h[1] << 8) |
                     ((std::uint32_t)h[2] << 16)) & 0x3FFFF;
  std::string out;
  for (std::size_t i = 0; i < kChecksumLetters; ++i) {
    out.push_back((char)('A' + c % 26));
    c /= 26;
  }
  return out;
}

PublicKey identity_to_public_key(const std::string& identity) {
  ensure<PreconditionError>(identity.size() == kIdentityLen,
                            "identity must be 60 letters, got " +
                                std::to_string(identity.size()));
  for (char ch : identity) {
    ensure<PreconditionError>(ch >= 'A' && ch <= 'Z', "identity must be upper-case A-Z");
  }

  PublicKey pk{};
  for (std::size_t g = 0; g < 4; ++g) {
    std::uint64_t v = 0;
    for (std::size_t j = kGroupLetters; j-- > 0;) {
      const std::uint64_t digit = (std::uint64_t)(identity[g * kGroupLetters + j] - 'A');
      ensure<PreconditionError>(
          v <= ((std::numeric_limits<std::uint64_t>::max)() - digit) / 26,
          "identity group does not fit 64 bits");
      v = v * 26 + digit;
    }
    for (std::size_t k = 0; k < 8; ++k) pk[g * 8 + k] = (std::uint8_t)((v >> (8 * k)) & 0xFF);
  }
  return pk;
}

std::string public_key_to_identity(const PublicKey& pk) {
  std::string out;
  out.reserve(kIdentityLen);
  for (std::size_t g = 0; g < 4; ++g) {
    std::uint64_t v = 0;
    for (std::size_t k = 0; k < 8; ++k) v |= (std::uint64_t)pk[g * 8 + k] << (8 * k);
    for (std::size_t j = 0; j < kGroupLetters; ++j) {
      out.push_back((char)('A' + v % 26));
      v /= 26;
    }
  }
  out += checksum_letters(pk);
  return out;
}

bool is_valid_identity(const std::string& identity) {
  PublicKey pk{};
  try {
    pk = identity_to_public_key(identity);
  } catch (const PreconditionError&) {
    return false;
  }
  return identity.compare(kIdentityLen - kChecksumLetters, kChecksumLetters,
                          checksum_letters(pk)) == 0;
}

} // namespace qwire
