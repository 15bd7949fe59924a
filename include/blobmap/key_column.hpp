#pragma once
#include <blobmap/byte_io.hpp>

#include <cstdint>
#include <string_view>

namespace blobmap {

// keyOffsets[n] + keysBlob поверх чужих байт. Ничего не копирует.
class KeyColumn {
public:
  KeyColumn() = default;
  KeyColumn(const uint8_t* offsets, int32_t count, const uint8_t* keys,
            int32_t keys_length)
      : offsets_(offsets), keys_(reinterpret_cast<const char*>(keys)),
        count_(count), keys_length_(keys_length) {}

  // Первый >= 0, неубывание, каждый < keys_length. Бросает MalformedBlob(Offsets).
  void validate() const;

  int32_t offset(int32_t i) const noexcept { return load_i32(offsets_ + 4 * static_cast<size_t>(i)); }

  int32_t length(int32_t i) const noexcept {
    return i < count_ - 1 ? offset(i + 1) - offset(i) : keys_length_ - offset(i);
  }

  std::string_view key(int32_t i) const noexcept {
    return {keys_ + offset(i), static_cast<size_t>(length(i))};
  }

  int32_t keys_length() const noexcept { return keys_length_; }

private:
  const uint8_t* offsets_ = nullptr;
  const char*    keys_ = nullptr;
  int32_t        count_ = 0;
  int32_t        keys_length_ = 0;
};

} // namespace blobmap
