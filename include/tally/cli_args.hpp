#pragma once

// tally/cli_args.hpp - Command line split into positional words and flags.
//
// "--name value" pairs and bare "--name" flags (value "true") may appear
// before, between or after the command words. A flag takes the next token as
// its value unless that token itself starts with "--".

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tally {

struct CommandLine {
  std::vector<std::string> words;             // command, subcommand, ...
  std::map<std::string, std::string> flags;

  // "" when there are fewer than i + 1 words.
  std::string word(size_t i) const;
  std::optional<std::string> flag(const std::string& name) const;
};

CommandLine parse_command_line(int argc, const char* const* argv);

}  // namespace tally
