#include "MARError.hpp"

#include <magic_enum/magic_enum.hpp>

namespace libmar {

std::string_view MarErrorKindName(MarErrorKind kind) {
  return magic_enum::enum_name(kind);
}

std::string MarError::format() const {
  if (!offset.has_value()) {
    return fmt::format("{}: {}", MarErrorKindName(kind), message);
  }
  return fmt::format("{} at 0x{:x} ({}): {}", MarErrorKindName(kind), *offset,
                     *offset, message);
}

} // namespace libmar
