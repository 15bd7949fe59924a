#include <blobmap/key_list.hpp>

#include <fmt/format.h>

#include <charconv>
#include <fstream>
#include <string_view>
#include <utility>

namespace blobmap {

bool read_key_list(const std::string& path, std::vector<KeyLine>& out, std::string* err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (err) *err = fmt::format("cannot open key list {}", path);
    return false;
  }

  std::string line;
  size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;

    KeyLine kl;
    const auto tab = line.rfind('\t');
    if (tab == std::string::npos) {
      kl.key = line;
    } else {
      const std::string_view num = std::string_view(line).substr(tab + 1);
      int32_t v = 0;
      auto [p, ec] = std::from_chars(num.data(), num.data() + num.size(), v);
      if (ec != std::errc{} || p != num.data() + num.size()) {
        if (err) *err = fmt::format("{}:{}: bad value \"{}\"", path, lineno, num);
        return false;
      }
      kl.key = line.substr(0, tab);
      kl.value = v;
    }
    out.push_back(std::move(kl));
  }
  return true;
}

} // namespace blobmap
