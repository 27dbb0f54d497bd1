#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace dqv::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns an empty string on success or a message describing why the
// value was rejected.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<std::string(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedOptions {
  Config config;                    // NOLINT(readability-identifier-naming)
  std::vector<std::string> errors;  // NOLINT(readability-identifier-naming)
  bool help_requested{false};       // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised flag
// to its handler. Every problem (unknown flag, missing value, rejected value,
// stray positional argument) is collected in errors; parsing continues so the
// caller can report them all at once. --help / -h sets help_requested.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), {}, false};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    if (arg == "--help" || arg == "-h") {
      parsed.help_requested = true;
      continue;
    }

    const auto it = option_map.find(arg);
    if (it == option_map.end()) {
      parsed.errors.push_back(!arg.empty() && arg[0] == '-' ? "Unknown option: " + arg
                                                            : "Unexpected argument: " + arg);
      continue;
    }

    const Option<Config>* opt = it->second;
    std::string value;
    if (opt->requires_value) {
      if (i + 1 >= argc) {
        parsed.errors.push_back("Option " + arg + " requires a value");
        continue;
      }
      value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    std::string error = opt->handler(parsed.config, value);
    if (!error.empty()) {
      parsed.errors.push_back(std::move(error));
    }
  }

  return parsed;
}

// format_options renders the option registry as an aligned help block.
template <typename Config>
std::string format_options(const std::vector<Option<Config>>& options) {
  std::size_t width = 0;
  for (const auto& opt : options) {
    width = std::max(width, opt.name.size() + (opt.requires_value ? 8 : 0));
  }

  std::ostringstream out;
  for (const auto& opt : options) {
    std::string flag = opt.name + (opt.requires_value ? " <value>" : "");
    flag.resize(width, ' ');
    out << "  " << flag << "  " << opt.description << "\n";
  }
  return out.str();
}

}  // namespace dqv::apps
