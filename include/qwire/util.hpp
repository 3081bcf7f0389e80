#pragma once
#include "qwire.hpp"
#include <string>
#include <cstddef>
#include <cstdint>

namespace qwire {

// Key material. Wiped on destruction; a moved-from value is left empty.
struct SecureBytes {
  Bytes b;
  SecureBytes() = default;
  explicit SecureBytes(std::size_t n);
  explicit SecureBytes(Bytes&& bytes) noexcept;
  ~SecureBytes();
  SecureBytes(const SecureBytes&) = delete;
  SecureBytes& operator=(const SecureBytes&) = delete;
  SecureBytes(SecureBytes&&) noexcept;
  SecureBytes& operator=(SecureBytes&&) noexcept;

  void wipe() noexcept;
};

void secure_bzero(void* p, std::size_t n);

void rand_bytes(std::uint8_t* out, std::size_t n);
std::uint32_t rand_u32();

Digest sha256(const std::uint8_t* data, std::size_t n);
Digest sha256(const Bytes& data);

std::string to_hex(const std::uint8_t* data, std::size_t n);
std::string to_hex(const Bytes& data);
template <std::size_t N>
std::string to_hex(const std::array<std::uint8_t, N>& a) { return to_hex(a.data(), N); }

// Throws PreconditionError on odd length or non-hex characters.
Bytes from_hex(const std::string& hex);

bool is_zero(const std::uint8_t* data, std::size_t n);
template <std::size_t N>
bool is_zero(const std::array<std::uint8_t, N>& a) { return is_zero(a.data(), N); }

// Whole file contents. PreconditionError when the file cannot be read.
Bytes read_file(const std::string& path);

} // namespace qwire
