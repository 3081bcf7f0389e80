#pragma once
#include "qwire.hpp"
#include <string>

namespace qwire {

// Textual identity: 56 upper-case letters encoding the 32-byte public key as
// four little-endian u64 groups (14 base-26 digits each, least significant
// first), followed by a 4-letter checksum.
static constexpr std::size_t kIdentityLen = 60;

// Throws PreconditionError for a wrong length, a non upper-case letter, or a
// group that does not fit 64 bits. The checksum is not verified.
PublicKey identity_to_public_key(const std::string& identity);

std::string public_key_to_identity(const PublicKey& pk);

// Length, alphabet and checksum all valid.
bool is_valid_identity(const std::string& identity);

} // namespace qwire
