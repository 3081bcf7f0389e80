#include "qwire/codec.hpp"
#include "qwire/errors.hpp"
#include <algorithm>

namespace qwire {

// ------------------------------ ByteWriter ------------------------------

void ByteWriter::u16(std::uint16_t v) {
  out_.push_back((std::uint8_t)(v & 0xFF));
  out_.push_back((std::uint8_t)((v >> 8) & 0xFF));
}

void ByteWriter::u32(std::uint32_t v) {
  for (int i = 0; i < 4; ++i) out_.push_back((std::uint8_t)((v >> (8 * i)) & 0xFF));
}

void ByteWriter::u64(std::uint64_t v) {
  for (int i = 0; i < 8; ++i) out_.push_back((std::uint8_t)((v >> (8 * i)) & 0xFF));
}

void ByteWriter::raw(const std::uint8_t* data, std::size_t n) {
  if (n) out_.insert(out_.end(), data, data + n);
}

void ByteWriter::text(const std::string& s, std::size_t slot, const char* field) {
  ensure<FieldOverflow>(s.size() <= slot, std::string(field) + " exceeds " +
                                              std::to_string(slot) + " bytes");
  out_.insert(out_.end(), s.begin(), s.end());
  zeros(slot - s.size());
}

// ------------------------------ ByteReader ------------------------------

void ByteReader::need(std::size_t n, const char* what) const {
  ensure<MalformedMessage>(n <= remaining(), what);
}

std::uint8_t ByteReader::u8() {
  need(1, "parse overflow (u8)");
  return *p_++;
}

std::uint16_t ByteReader::u16() {
  need(2, "parse overflow (u16)");
  std::uint16_t v = (std::uint16_t)(std::uint16_t(p_[0]) | (std::uint16_t(p_[1]) << 8));
  p_ += 2;
  return v;
}

std::uint32_t ByteReader::u32() {
  need(4, "parse overflow (u32)");
  std::uint32_t v = 0;
  for (int i = 3; i >= 0; --i) v = (v << 8) | p_[i];
  p_ += 4;
  return v;
}

std::uint64_t ByteReader::u64() {
  need(8, "parse overflow (u64)");
  std::uint64_t v = 0;
  for (int i = 7; i >= 0; --i) v = (v << 8) | p_[i];
  p_ += 8;
  return v;
}

Bytes ByteReader::raw(std::size_t n) {
  need(n, "parse overflow (vec)");
  Bytes out(p_, p_ + n);
  p_ += n;
  return out;
}

void ByteReader::raw(std::uint8_t* out, std::size_t n) {
  need(n, "parse overflow (vec)");
  std::copy(p_, p_ + n, out);
  p_ += n;
}

void ByteReader::skip(std::size_t n) {
  need(n, "parse overflow (skip)");
  p_ += n;
}

std::string ByteReader::text(std::size_t slot) {
  need(slot, "parse overflow (text)");
  const std::uint8_t* nul = std::find(p_, p_ + slot, (std::uint8_t)0);
  std::string s((const char*)p_, (const char*)nul);
  p_ += slot;
  return s;
}

void ByteReader::expect_end() const {
  ensure<MalformedMessage>(p_ == end_, "trailing bytes");
}

} // namespace qwire
