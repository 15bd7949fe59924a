#include <blobmap/cli.hpp>

#include <cstdlib>
#include <string_view>
#include <utility>

namespace blobmap {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

static std::optional<BlobKind> parse_kind(std::string_view s) {
  if (s == "sorted") return BlobKind::Sorted;
  if (s == "hashed") return BlobKind::Hashed;
  return std::nullopt;
}

static bool parse_rate(const char* s, double& out) {
  char* end = nullptr;
  out = std::strtod(s, &end);
  return end && *end == '\0' && out >= 0.0 && out <= 1.0;
}

ParseResult parse_cli(int argc, char** argv) {
  ParseResult r{};

  // глобальный флаг может стоять где угодно
  std::vector<char*> args;
  for (int i = 0; i < argc; ++i) {
    std::string_view a = argv[i];
    if (i > 0 && (a == "--verbose" || a == "-v")) {
      r.verbose = true;
      continue;
    }
    args.push_back(argv[i]);
  }
  argc = static_cast<int>(args.size());
  argv = args.data();

  if (argc < 2) {
    r.cmd = CmdHelp{};
    return r;
  }

  const std::string cmd = argv[1];
  if (cmd == "--help" || cmd == "help" || cmd == "-h") {
    r.cmd = CmdHelp{};
    return r;
  }
  if (cmd == "--version" || cmd == "version") {
    r.cmd = CmdVersion{};
    return r;
  }

  if (cmd == "compile") {
    CmdCompile c{};
    for (int i = 2; i < argc; i++) {
      std::string_view a = argv[i];
      if (a == "--kind" && has_arg(i, argc)) {
        auto k = parse_kind(argv[++i]);
        if (!k) {
          r.error = "compile: --kind must be sorted or hashed";
          return r;
        }
        c.kind = *k;
      } else if (a == "--keys" && has_arg(i, argc)) {
        c.keys_path = argv[++i];
      } else if (a == "--out" && has_arg(i, argc)) {
        c.out_path = argv[++i];
      } else if (a == "--max-collision-rate" && has_arg(i, argc)) {
        if (!parse_rate(argv[++i], c.options.max_collision_rate)) {
          r.error = "compile: --max-collision-rate must be in [0, 1]";
          return r;
        }
      } else {
        r.error = "compile: unexpected argument " + std::string(a);
        return r;
      }
    }
    if (c.keys_path.empty() || c.out_path.empty()) {
      r.error = "compile: --keys and --out required";
      return r;
    }
    r.cmd = c;
    return r;
  }

  // lookup / dump / info: --blob FILE [--verify] [KEY...]
  if (cmd == "lookup" || cmd == "dump" || cmd == "info") {
    std::string blob;
    LoadOptions opts;
    std::vector<std::string> keys;
    for (int i = 2; i < argc; i++) {
      std::string_view a = argv[i];
      if (a == "--blob" && has_arg(i, argc))
        blob = argv[++i];
      else if (a == "--verify")
        opts.verify_keys = true;
      else if (cmd == "lookup")
        keys.emplace_back(a);
      else {
        r.error = cmd + ": unexpected argument " + std::string(a);
        return r;
      }
    }
    if (blob.empty()) {
      r.error = cmd + ": --blob required";
      return r;
    }
    if (cmd == "lookup") {
      if (keys.empty()) {
        r.error = "lookup: at least one key required";
        return r;
      }
      r.cmd = CmdLookup{blob, std::move(keys), opts};
    } else if (cmd == "dump") {
      r.cmd = CmdDump{blob, opts};
    } else {
      r.cmd = CmdInfo{blob, opts};
    }
    return r;
  }

  r.error = "unknown command: " + cmd;
  return r;
}

} // namespace blobmap
