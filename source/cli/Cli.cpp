#include "Cli.hpp"

#include <fmt/core.h>
#include <string_view>

void PrintUsage() {
  fmt::print(stderr, "Usage: marinfo <from> [--list | --json] "
                     "[--signable <to>] [--strict] [--verbose]\n");
}

std::optional<CliOptions> parse(int argc, const char** argv) {
  CliOptions args{};
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--list") {
      args.list_only = true;
    } else if (arg == "--json") {
      args.json = true;
    } else if (arg == "--strict") {
      args.strict = true;
    } else if (arg == "--verbose" || arg == "-v") {
      args.verbose = true;
    } else if (arg == "--signable") {
      if (i + 1 >= argc) {
        fmt::print(stderr, "Error: --signable expects an output path\n");
        return std::nullopt;
      }
      args.signable_to = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      return std::nullopt;
    } else if (arg.starts_with("-")) {
      fmt::print(stderr, "Error: Unknown option {}\n", arg);
      return std::nullopt;
    } else if (args.from.empty()) {
      args.from = arg;
    } else {
      fmt::print(stderr, "Error: Unexpected argument {}\n", arg);
      return std::nullopt;
    }
  }
  if (args.list_only && args.json) {
    fmt::print(stderr, "Error: --list and --json are exclusive\n");
    return std::nullopt;
  }
  if (args.from.empty()) {
    fmt::print(stderr, "Error: Too few arguments\n");
    return std::nullopt;
  }
  return args;
}
