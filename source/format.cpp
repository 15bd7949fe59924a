#include <blobmap/byte_io.hpp>
#include <blobmap/errors.hpp>
#include <blobmap/format.hpp>

#include <fmt/format.h>

namespace blobmap {

const char* to_string(BlobKind kind) noexcept {
  switch (kind) {
  case BlobKind::Sorted: return "sorted";
  case BlobKind::Hashed: return "hashed";
  }
  return "unknown";
}

const uint8_t* BlobCursor::take(uint64_t n, std::string_view what) {
  if (n > remaining()) {
    throw MalformedBlob(BlobDefect::Length,
                        fmt::format("{}: need {} bytes at offset {}, have {}",
                                    what, n, pos_, remaining()));
  }
  const uint8_t* p = data_.data() + pos_;
  pos_ += static_cast<size_t>(n);
  return p;
}

std::optional<BlobKind> read_kind(std::span<const uint8_t> blob) noexcept {
  if (blob.size() < kPreambleSize) return std::nullopt;
  if (load_u32(blob.data()) != kBlobMagic) return std::nullopt;
  if (load_u16(blob.data() + 4) != kBlobVersion) return std::nullopt;
  const uint16_t kind = load_u16(blob.data() + 6);
  if (kind == static_cast<uint16_t>(BlobKind::Sorted)) return BlobKind::Sorted;
  if (kind == static_cast<uint16_t>(BlobKind::Hashed)) return BlobKind::Hashed;
  return std::nullopt;
}

Preamble read_preamble(std::span<const uint8_t> blob, BlobKind expected) {
  if (blob.size() < kPreambleSize) {
    throw MalformedBlob(BlobDefect::Length,
                        fmt::format("preamble: need {} bytes, have {}",
                                    kPreambleSize, blob.size()));
  }

  Preamble p{};
  p.magic = load_u32(blob.data());
  if (p.magic != kBlobMagic) {
    throw MalformedBlob(BlobDefect::Header,
                        fmt::format("bad magic {:#010x}", p.magic));
  }
  p.version = load_u16(blob.data() + 4);
  if (p.version != kBlobVersion) {
    throw MalformedBlob(BlobDefect::Header,
                        fmt::format("unsupported version {} (expected {})",
                                    p.version, kBlobVersion));
  }
  const uint16_t kind = load_u16(blob.data() + 6);
  if (kind != static_cast<uint16_t>(expected)) {
    throw MalformedBlob(BlobDefect::Header,
                        fmt::format("kind {} where {} expected", kind,
                                    to_string(expected)));
  }
  p.kind = expected;
  p.keys_length = load_i32(blob.data() + 8);
  if (p.keys_length < 0) {
    throw MalformedBlob(BlobDefect::Length,
                        fmt::format("negative keys length {}", p.keys_length));
  }
  return p;
}

} // namespace blobmap
