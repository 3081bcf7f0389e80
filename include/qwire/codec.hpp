#pragma once
#include "qwire.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace qwire {

// Little-endian, fixed-width writer for wire structures.
class ByteWriter {
public:
  ByteWriter() = default;
  explicit ByteWriter(std::size_t reserve) { out_.reserve(reserve); }

  void u8(std::uint8_t v) { out_.push_back(v); }
  void i8(std::int8_t v) { out_.push_back((std::uint8_t)v); }
  void u16(std::uint16_t v);
  void i16(std::int16_t v) { u16((std::uint16_t)v); }
  void u32(std::uint32_t v);
  void i32(std::int32_t v) { u32((std::uint32_t)v); }
  void u64(std::uint64_t v);
  void i64(std::int64_t v) { u64((std::uint64_t)v); }

  void raw(const std::uint8_t* data, std::size_t n);
  void raw(const Bytes& b) { raw(b.data(), b.size()); }
  template <std::size_t N>
  void fixed(const std::array<std::uint8_t, N>& a) { raw(a.data(), N); }
  void zeros(std::size_t n) { out_.insert(out_.end(), n, 0); }

  // Zero-padded text slot. Throws FieldOverflow when `s` does not fit.
  void text(const std::string& s, std::size_t slot, const char* field);

  std::size_t size() const { return out_.size(); }
  const Bytes& bytes() const { return out_; }
  Bytes take() { return std::move(out_); }

private:
  Bytes out_;
};

// Bounds-checked reader. Every read past the end throws MalformedMessage.
class ByteReader {
public:
  ByteReader(const std::uint8_t* data, std::size_t n) : p_(data), end_(data + n) {}
  explicit ByteReader(const Bytes& in) : ByteReader(in.data(), in.size()) {}

  std::uint8_t u8();
  std::int8_t i8() { return (std::int8_t)u8(); }
  std::uint16_t u16();
  std::int16_t i16() { return (std::int16_t)u16(); }
  std::uint32_t u32();
  std::int32_t i32() { return (std::int32_t)u32(); }
  std::uint64_t u64();
  std::int64_t i64() { return (std::int64_t)u64(); }

  Bytes raw(std::size_t n);
  void raw(std::uint8_t* out, std::size_t n);
  template <std::size_t N>
  std::array<std::uint8_t, N> fixed() {
    std::array<std::uint8_t, N> a{};
    raw(a.data(), N);
    return a;
  }
  void skip(std::size_t n);

  // Reads a zero-padded text slot, dropping the padding.
  std::string text(std::size_t slot);

  std::size_t remaining() const { return (std::size_t)(end_ - p_); }
  void expect_end() const;

private:
  void need(std::size_t n, const char* what) const;

  const std::uint8_t* p_;
  const std::uint8_t* end_;
};

// Whole-body helpers over the write()/read() members of wire structures.
template <typename T>
Bytes serialize(const T& v) {
  ByteWriter w;
  v.write(w);
  return w.take();
}

template <typename T>
T parse(const Bytes& in) {
  ByteReader r(in);
  T v = T::read(r);
  r.expect_end();
  return v;
}

} // namespace qwire
