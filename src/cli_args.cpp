#include "tally/cli_args.hpp"

#include <utility>

namespace tally {

std::string CommandLine::word(size_t i) const {
  return i < words.size() ? words[i] : std::string();
}

std::optional<std::string> CommandLine::flag(const std::string& name) const {
  auto it = flags.find(name);
  if (it == flags.end()) return std::nullopt;
  return it->second;
}

CommandLine parse_command_line(int argc, const char* const* argv) {
  CommandLine cl;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a.rfind("--", 0) != 0) {
      cl.words.push_back(std::move(a));
      continue;
    }
    a = a.substr(2);
    if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
      cl.flags[a] = argv[++i];
    } else {
      cl.flags[a] = "true";
    }
  }
  return cl;
}

}  // namespace tally
