#include "Cli.hpp"

#include <fmt/color.h>
#include <libmar/MAR.hpp>
#include <libmar/MARDump.hpp>
#include <libmar/MARJson.hpp>
#include <libmar/MARObserver.hpp>
#include <oishii/util/util.hxx>

static int run(const CliOptions& args) {
  auto file = libmar::ReadArchiveFile(args.from);
  if (!file) {
    rsl::error("{}", file.error());
    return -1;
  }
  if (!libmar::IsDataMarArchive(*file)) {
    rsl::warn("{} does not start with \"MAR1\"", args.from);
  }

  libmar::LoggingObserver observer;
  libmar::DecodeOptions options{
      .observer = args.verbose ? &observer : nullptr,
      .strict_index_size = args.strict,
      .path = args.from,
  };
  auto arc = libmar::LoadMarArchive(*file, options);
  if (!arc) {
    rsl::error("{}: {}", args.from, arc.error().format());
    return -1;
  }

  if (args.json) {
    fmt::print("{}\n", libmar::SerializeArchive(*arc));
  } else if (args.list_only) {
    fmt::print("{}", libmar::ListIndex(*arc));
  } else {
    fmt::print("{}", libmar::DescribeArchive(*arc));
  }

  if (!args.signable_to.empty()) {
    auto signable = libmar::SaveSignableBytes(*arc);
    if (!signable) {
      rsl::error("{}: {}", args.from, signable.error().format());
      return -1;
    }
    auto ok = oishii::FlushFile(*signable, args.signable_to);
    if (!ok) {
      rsl::error("{}", ok.error());
      return -1;
    }
    fmt::print(fmt::fg(fmt::color::green), "Wrote {} signable bytes to {}\n",
               signable->size(), args.signable_to);
  }
  return 0;
}

int main(int argc, const char** argv) {
  rsl::logging::init();
  auto args = parse(argc, argv);
  if (!args) {
    PrintUsage();
    return -1;
  }
  if (args->verbose) {
    rsl::logging::setLevel(rsl::logging::Level::Debug);
  }
  return run(*args);
}
