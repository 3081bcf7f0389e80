#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace qwire {

using Bytes = std::vector<std::uint8_t>;

static constexpr std::size_t kPublicKeyLen = 32;
static constexpr std::size_t kDigestLen = 32;
static constexpr std::size_t kSignatureLen = 64;

using PublicKey = std::array<std::uint8_t, kPublicKeyLen>;
using Digest = std::array<std::uint8_t, kDigestLen>;
using Signature = std::array<std::uint8_t, kSignatureLen>;

} // namespace qwire
