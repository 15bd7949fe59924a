#pragma once
#include <blobmap/errors.hpp>

#include <cstdint>
#include <utility>
#include <span>
#include <string_view>
#include <vector>

namespace blobmap {

// Чтение little-endian по байтам: безопасно для невыровненных адресов
// и не зависит от порядка байт платформы.

inline uint16_t load_u16(const uint8_t* p) noexcept {
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

inline uint32_t load_u32(const uint8_t* p) noexcept {
  return static_cast<uint32_t>(p[0]) |
         (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

inline int32_t load_i32(const uint8_t* p) noexcept {
  return static_cast<int32_t>(load_u32(p));
}

inline uint64_t load_u64(const uint8_t* p) noexcept {
  return static_cast<uint64_t>(load_u32(p)) |
         (static_cast<uint64_t>(load_u32(p + 4)) << 32);
}

// Накопитель блоба для компиляторов.
class BlobWriter {
public:
  void reserve(size_t n) { out_.reserve(n); }

  void put_u16(uint16_t v) {
    out_.push_back(static_cast<uint8_t>(v));
    out_.push_back(static_cast<uint8_t>(v >> 8));
  }
  void put_u32(uint32_t v) {
    for (int i = 0; i < 4; ++i) out_.push_back(static_cast<uint8_t>(v >> (8 * i)));
  }
  void put_i32(int32_t v) { put_u32(static_cast<uint32_t>(v)); }
  void put_u64(uint64_t v) {
    put_u32(static_cast<uint32_t>(v));
    put_u32(static_cast<uint32_t>(v >> 32));
  }
  void put_bytes(std::string_view s) {
    out_.insert(out_.end(), s.begin(), s.end());
  }

  size_t size() const { return out_.size(); }
  std::vector<uint8_t> take() { return std::move(out_); }

private:
  std::vector<uint8_t> out_;
};

// Курсор загрузчика: отдаёт подряд идущие куски блоба, при нехватке байт
// бросает MalformedBlob(Length). Размеры считаются в uint64, чтобы
// испорченный счётчик не переполнил арифметику.
class BlobCursor {
public:
  explicit BlobCursor(std::span<const uint8_t> data) : data_(data) {}

  size_t remaining() const { return data_.size() - pos_; }

  const uint8_t* take(uint64_t n, std::string_view what);

  int32_t take_i32(std::string_view what) { return load_i32(take(4, what)); }
  uint64_t take_u64(std::string_view what) { return load_u64(take(8, what)); }

  const uint8_t* rest() const { return data_.data() + pos_; }

private:
  std::span<const uint8_t> data_;
  size_t pos_ = 0;
};

} // namespace blobmap
