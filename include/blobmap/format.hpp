#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace blobmap {

// ---- Blob layout (little-endian, без выравнивания) ----
// [Preamble]
//   magic      u32  'BMAP'
//   version    u16
//   kind       u16  BlobKind
//   keys_len   i32  точная длина хвостового keysBlob
//
// kind == Sorted:
//   itemCount i32 | hashes[n] i32 | keyOffsets[n] i32 | keysBlob
//
// kind == Hashed:
//   itemCount i32 | keyHashes[n] i32 | keyOffsets[n] i32 | values[n] i32
//   bucketCount i32 | buckets[b] {start i32, end i32} | fastModMultiplier u64
//   keysBlob
//
// Длина ключа i: keyOffsets[i+1] - keyOffsets[i], у последнего
// keys_len - keyOffsets[i].

enum class BlobKind : uint16_t {
  Sorted = 1, // бинарный поиск по (hash, bytes)
  Hashed = 2, // бакеты + fast-mod
};

inline constexpr uint32_t kBlobMagic    = 0x50414D42u; // "BMAP" в порядке байт файла
inline constexpr uint16_t kBlobVersion  = 1;
inline constexpr size_t   kPreambleSize = 12;
inline constexpr size_t   kBucketSize   = 8;

struct Preamble {
  uint32_t magic = kBlobMagic;
  uint16_t version = kBlobVersion;
  BlobKind kind = BlobKind::Sorted;
  int32_t  keys_length = 0;
};

// Полуинтервал [start, end) в линеаризованных массивах.
struct Bucket {
  int32_t start = 0;
  int32_t end = 0;

  int32_t size() const { return end - start; }
};

const char* to_string(BlobKind kind) noexcept;

// Вид блоба по преамбуле; nullopt, если преамбула не наша.
std::optional<BlobKind> read_kind(std::span<const uint8_t> blob) noexcept;

// Разбор преамбулы с проверкой magic/version/kind; бросает MalformedBlob.
Preamble read_preamble(std::span<const uint8_t> blob, BlobKind expected);

} // namespace blobmap
