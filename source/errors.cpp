#include <blobmap/errors.hpp>
#include <fmt/format.h>

namespace blobmap {

const char* to_string(BlobDefect d) noexcept {
  switch (d) {
  case BlobDefect::Header:  return "header";
  case BlobDefect::Length:  return "length";
  case BlobDefect::Offsets: return "offsets";
  case BlobDefect::Order:   return "order";
  case BlobDefect::Buckets: return "buckets";
  case BlobDefect::KeyHash: return "key hash";
  }
  return "unknown";
}

MalformedBlob::MalformedBlob(BlobDefect defect, const std::string& detail)
    : std::runtime_error(
          fmt::format("malformed blob ({}): {}", to_string(defect), detail)),
      defect_(defect) {}

// Ключи бинарные, в сообщение кладём только печатаемый префикс.
static std::string printable(std::string_view key) {
  std::string out;
  for (char c : key.substr(0, 64)) {
    const auto u = static_cast<unsigned char>(c);
    if (u >= 0x20 && u < 0x7f) out.push_back(c);
    else out += fmt::format("\\x{:02x}", u);
  }
  if (key.size() > 64) out += "...";
  return out;
}

DuplicateKey::DuplicateKey(std::string_view key)
    : std::invalid_argument(fmt::format("duplicate key \"{}\"", printable(key))),
      key_(key) {}

} // namespace blobmap
