#include <blobmap/errors.hpp>
#include <blobmap/key_column.hpp>

#include <fmt/format.h>

namespace blobmap {

void KeyColumn::validate() const {
  int32_t prev = 0;
  for (int32_t i = 0; i < count_; ++i) {
    const int32_t off = offset(i);
    if (off < prev) {
      throw MalformedBlob(BlobDefect::Offsets,
                          fmt::format("keyOffsets[{}] = {} is below {}", i, off, prev));
    }
    if (off >= keys_length_) {
      throw MalformedBlob(BlobDefect::Offsets,
                          fmt::format("keyOffsets[{}] = {} is past keys region of {} bytes",
                                      i, off, keys_length_));
    }
    prev = off;
  }
}

} // namespace blobmap
