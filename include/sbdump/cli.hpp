#pragma once
#include <sbdump/config.hpp>

#include <optional>
#include <string>
#include <variant>

namespace sbdump {

struct CmdDump {
  DumpConfig cfg;
};
struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdDump, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
};

// Starts from config_from_env(); flags override it.
ParseResult parse_cli(int argc, char **argv);

} // namespace sbdump
