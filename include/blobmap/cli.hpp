#pragma once
#include <blobmap/format.hpp>
#include <blobmap/options.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace blobmap {

struct CmdCompile {
  BlobKind kind = BlobKind::Hashed;
  std::string keys_path;
  std::string out_path;
  CompileOptions options;
};
struct CmdLookup {
  std::string blob_path;
  std::vector<std::string> keys;
  LoadOptions options;
};
struct CmdDump {
  std::string blob_path;
  LoadOptions options;
};
struct CmdInfo {
  std::string blob_path;
  LoadOptions options;
};

struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdCompile, CmdLookup, CmdDump, CmdInfo, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
  bool verbose = false;
};

ParseResult parse_cli(int argc, char** argv);

} // namespace blobmap
