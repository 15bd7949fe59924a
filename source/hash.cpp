#include <blobmap/hash.hpp>
#include <xxhash.h>

namespace blobmap {

int32_t key_hash(std::string_view key) noexcept {
  const uint64_t h = static_cast<uint64_t>(XXH3_64bits(key.data(), key.size()));
  return static_cast<int32_t>(static_cast<uint32_t>(h));
}

} // namespace blobmap
