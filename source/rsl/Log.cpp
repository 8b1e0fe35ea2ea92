#include "Log.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <string>

#include <fmt/color.h>

namespace rsl {
namespace logging {

static std::atomic<Level> sLevel = Level::Warn;

static bool ParseLevel(std::string_view s, Level& out) {
  if (s == "error")
    out = Level::Error;
  else if (s == "warn")
    out = Level::Warn;
  else if (s == "info")
    out = Level::Info;
  else if (s == "debug")
    out = Level::Debug;
  else if (s == "trace")
    out = Level::Trace;
  else
    return false;
  return true;
}

static void Emit(Level level, std::string_view s) {
  if (!enabled(level))
    return;
  switch (level) {
  case Level::Error:
    fmt::print(stderr, fg(fmt::color::red) | fmt::emphasis::bold, "[error] ");
    break;
  case Level::Warn:
    fmt::print(stderr, fg(fmt::color::yellow), "[warn]  ");
    break;
  case Level::Info:
    fmt::print(stderr, fg(fmt::color::green), "[info]  ");
    break;
  case Level::Debug:
    fmt::print(stderr, fg(fmt::color::cyan), "[debug] ");
    break;
  case Level::Trace:
    fmt::print(stderr, fg(fmt::color::gray), "[trace] ");
    break;
  }
  fmt::print(stderr, "{}\n", s);
}

void init() {
  const char* env = std::getenv("RSL_LOG_LEVEL");
  if (env == nullptr)
    return;
  Level level;
  if (!ParseLevel(env, level)) {
    Emit(Level::Warn,
         fmt::format("Ignoring unknown RSL_LOG_LEVEL \"{}\"", env));
    return;
  }
  setLevel(level);
}
void setLevel(Level level) { sLevel.store(level); }
Level getLevel() { return sLevel.load(); }
bool enabled(Level level) {
  return static_cast<int>(level) <= static_cast<int>(sLevel.load());
}

void debug(std::string_view s) { Emit(Level::Debug, s); }
void error(std::string_view s) { Emit(Level::Error, s); }
void info(std::string_view s) { Emit(Level::Info, s); }
void log(Level l, std::string_view s) { Emit(l, s); }
void trace(std::string_view s) { Emit(Level::Trace, s); }
void warn(std::string_view s) { Emit(Level::Warn, s); }

} // namespace logging
} // namespace rsl
