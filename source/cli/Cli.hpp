#pragma once

#include <optional>
#include <string>

// marinfo <from>
// --list              only print the index
// --json              print every parsed field as JSON
// --signable <to>     write the bytes covered by the signatures
// --strict            reject archives whose index size is wrong
// --verbose           trace the archive structure while decoding
//
struct CliOptions {
  std::string from;
  std::string signable_to;
  bool list_only = false;
  bool json = false;
  bool strict = false;
  bool verbose = false;
};

void PrintUsage();
std::optional<CliOptions> parse(int argc, const char** argv);
