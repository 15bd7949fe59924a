#include <blobmap/app.hpp>
#include <blobmap/cli.hpp>
#include <blobmap/errors.hpp>
#include <blobmap/hashed_table.hpp>
#include <blobmap/key_list.hpp>
#include <blobmap/mapped_blob.hpp>
#include <blobmap/sorted_table.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#ifndef BLOBMAP_VERSION
#define BLOBMAP_VERSION "unknown"
#endif

namespace blobmap {

static void print_help(std::ostream& out) {
  out <<
      R"(blobmap - precompiled immutable key->index tables

Usage:
  blobmap compile --keys FILE --out FILE [--kind sorted|hashed] [--max-collision-rate R]
  blobmap lookup  --blob FILE [--verify] KEY...
  blobmap dump    --blob FILE [--verify]
  blobmap info    --blob FILE [--verify]
  blobmap help | version

Key list: one key per line; for hashed tables "key<TAB>value" sets the value
explicitly, otherwise the entry's ordinal is used.

Options:
  --verbose, -v   debug logging
  --verify        recompute key hashes while loading
)";
}

static int do_compile(const CmdCompile& c, std::ostream& out) {
  std::vector<KeyLine> lines;
  std::string err;
  if (!read_key_list(c.keys_path, lines, &err)) {
    spdlog::error("{}", err);
    return 1;
  }

  CompiledTable compiled;
  try {
    if (c.kind == BlobKind::Sorted) {
      std::vector<std::string> keys;
      keys.reserve(lines.size());
      for (auto& l : lines) {
        if (l.value) {
          spdlog::error("sorted tables assign positions; explicit value for \"{}\" not allowed",
                        l.key);
          return 2;
        }
        keys.push_back(std::move(l.key));
      }
      compiled = compile_sorted(keys);
    } else {
      std::vector<std::pair<std::string, int32_t>> entries;
      entries.reserve(lines.size());
      for (size_t i = 0; i < lines.size(); ++i) {
        const int32_t v = lines[i].value.value_or(static_cast<int32_t>(i));
        entries.emplace_back(std::move(lines[i].key), v);
      }
      compiled = compile_hashed(entries, c.options);
    }
  } catch (const std::invalid_argument& e) {
    spdlog::error("compile failed: {}", e.what());
    return 1;
  }

  if (!write_blob_file(c.out_path, compiled.blob)) return 1;

  out << fmt::format("compiled {} keys ({}) -> {} ({} bytes)\n", compiled.index.size(),
                     to_string(c.kind), c.out_path, compiled.blob.size());
  return 0;
}

// Открывает блоб и зовёт fn с SortedTable или HashedTable.
template <class Fn>
static int with_table(const std::string& path, const LoadOptions& opts, Fn&& fn) {
  MappedBlob mb;
  if (!mb.open(path)) return 1;

  const auto kind = read_kind(mb.bytes());
  try {
    if (kind == BlobKind::Sorted) {
      SortedTable t(mb.bytes(), opts);
      return fn(t, mb);
    }
    // неизвестный kind тоже отдаём HashedTable: его read_preamble скажет, что не так
    HashedTable t(mb.bytes(), opts);
    return fn(t, mb);
  } catch (const MalformedBlob& e) {
    spdlog::error("{}: {}", path, e.what());
    return 1;
  }
}

int App::run(int argc, char** argv) {
  auto pr = parse_cli(argc, argv);
  spdlog::set_level(pr.verbose ? spdlog::level::debug : spdlog::level::warn);

  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help(out_);
    return pr.error.empty() ? 0 : 2;
  }

  return std::visit(
      [&](auto&& c) -> int {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, CmdHelp>) {
          print_help(out_);
          return 0;

        } else if constexpr (std::is_same_v<T, CmdVersion>) {
          out_ << fmt::format("blobmap {} (format v{})\n", BLOBMAP_VERSION, kBlobVersion);
          return 0;

        } else if constexpr (std::is_same_v<T, CmdCompile>) {
          return do_compile(c, out_);

        } else if constexpr (std::is_same_v<T, CmdLookup>) {
          return with_table(c.blob_path, c.options, [&](const auto& t, const MappedBlob&) {
            using Table = std::decay_t<decltype(t)>;
            for (const auto& key : c.keys) {
              if constexpr (std::is_same_v<Table, SortedTable>) {
                const int32_t i = t.index_of(key);
                if (i >= 0)
                  out_ << fmt::format("{}\t{}\n", key, i);
                else
                  out_ << fmt::format("{}\tnot found (insertion point {})\n", key, ~i);
              } else {
                const auto v = t.find(key);
                if (v)
                  out_ << fmt::format("{}\t{}\n", key, *v);
                else
                  out_ << fmt::format("{}\tnot found\n", key);
              }
            }
            return 0;
          });

        } else if constexpr (std::is_same_v<T, CmdDump>) {
          return with_table(c.blob_path, c.options, [&](const auto& t, const MappedBlob&) {
            for (const Entry e : t)
              out_ << fmt::format("{}\t{}\n", e.value, e.key);
            return 0;
          });

        } else if constexpr (std::is_same_v<T, CmdInfo>) {
          return with_table(c.blob_path, c.options, [&](const auto& t, const MappedBlob& mb) {
            using Table = std::decay_t<decltype(t)>;
            const bool hashed = std::is_same_v<Table, HashedTable>;
            out_ << fmt::format("kind:       {}\n", hashed ? "hashed" : "sorted");
            out_ << fmt::format("items:      {}\n", t.size());
            out_ << fmt::format("key bytes:  {}\n", t.keys_length());
            out_ << fmt::format("blob bytes: {}\n", mb.bytes().size());
            if constexpr (std::is_same_v<Table, HashedTable>) {
              out_ << fmt::format("buckets:    {}\n", t.bucket_count());
              out_ << fmt::format("largest:    {}\n", t.max_bucket_size());
            }
            return 0;
          });
        }
      },
      *pr.cmd);
}

} // namespace blobmap
