#include "qwire/util.hpp"
#include "qwire/errors.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <fstream>
#include <utility>

namespace qwire {

void secure_bzero(void* p, std::size_t n) {
  if (p && n) OPENSSL_cleanse(p, n);
}

SecureBytes::SecureBytes(std::size_t n) : b(n) {}
SecureBytes::SecureBytes(Bytes&& bytes) noexcept : b(std::move(bytes)) {}
SecureBytes::~SecureBytes() { wipe(); }

SecureBytes::SecureBytes(SecureBytes&& o) noexcept : b(std::move(o.b)) { o.b.clear(); }

SecureBytes& SecureBytes::operator=(SecureBytes&& o) noexcept {
  if (this != &o) {
    wipe();
    b = std::move(o.b);
    o.b.clear();
  }
  return *this;
}

void SecureBytes::wipe() noexcept {
  secure_bzero(b.data(), b.size());
  b.clear();
}

void rand_bytes(std::uint8_t* out, std::size_t n) {
  ensure(RAND_bytes(out, (int)n) == 1, "RAND_bytes failed");
}

std::uint32_t rand_u32() {
  std::uint8_t b[4];
  rand_bytes(b, sizeof(b));
  return (std::uint32_t)b[0] | ((std::uint32_t)b[1] << 8) |
         ((std::uint32_t)b[2] << 16) | ((std::uint32_t)b[3] << 24);
}

Digest sha256(const std::uint8_t* data, std::size_t n) {
  Digest out{};
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  ensure(ctx != nullptr, "EVP_MD_CTX_new failed");
  unsigned int len = 0;
  const bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
                  EVP_DigestUpdate(ctx, data, n) == 1 &&
                  EVP_DigestFinal_ex(ctx, out.data(), &len) == 1;
  EVP_MD_CTX_free(ctx);
  ensure(ok, "sha256 digest failed");
  ensure(len == out.size(), "sha256 length mismatch");
  return out;
}

Digest sha256(const Bytes& data) { return sha256(data.data(), data.size()); }

std::string to_hex(const std::uint8_t* data, std::size_t n) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(n * 2);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0F]);
  }
  return out;
}

std::string to_hex(const Bytes& data) { return to_hex(data.data(), data.size()); }

static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

Bytes from_hex(const std::string& hex) {
  ensure<PreconditionError>(hex.size() % 2 == 0, "hex string has odd length");
  Bytes out(hex.size() / 2);
  for (std::size_t i = 0; i < out.size(); ++i) {
    int hi = hex_value(hex[2 * i]);
    int lo = hex_value(hex[2 * i + 1]);
    ensure<PreconditionError>(hi >= 0 && lo >= 0, "invalid hex character");
    out[i] = (std::uint8_t)((hi << 4) | lo);
  }
  return out;
}

bool is_zero(const std::uint8_t* data, std::size_t n) {
  for (std::size_t i = 0; i < n; ++i) {
    if (data[i] != 0) return false;
  }
  return true;
}

Bytes read_file(const std::string& path) {
  std::ifstream f(path, std::ios::binary | std::ios::ate);
  ensure<PreconditionError>(f.good(), "cannot open " + path);
  const std::streamsize n = f.tellg();
  ensure<PreconditionError>(n >= 0, "cannot size " + path);
  Bytes out((std::size_t)n);
  f.seekg(0, std::ios::beg);
  if (n > 0) f.read((char*)out.data(), n);
  ensure<PreconditionError>((bool)f, "short read from " + path);
  return out;
}

} // namespace qwire
