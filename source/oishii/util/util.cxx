#include "util.hxx"

#include <fstream>
#include <rsl/Expect.hpp>

namespace oishii {

std::expected<std::vector<u8>, std::string>
UtilReadFile(std::string_view path) {
  std::ifstream file(std::string(path), std::ios::binary | std::ios::ate);
  if (!file) {
    return RSL_UNEXPECTED("Failed to open file " + std::string(path));
  }

  const auto size = file.tellg();
  EXPECT(size >= 0, "Failed to size file " + std::string(path));
  std::vector<u8> vec(static_cast<size_t>(size));
  file.seekg(0, std::ios::beg);

  if (!file.read(reinterpret_cast<char*>(vec.data()), vec.size())) {
    return RSL_UNEXPECTED("Failed to read file " + std::string(path));
  }

  return vec;
}

static std::expected<void, std::string>
OishiiDefaultFlushFile(std::span<const u8> buf, std::string_view path) {
  std::ofstream stream(std::string(path), std::ios::binary | std::ios::out);
  if (!stream) {
    return RSL_UNEXPECTED("Failed to open file " + std::string(path) +
                          " for writing");
  }
  stream.write(reinterpret_cast<const char*>(buf.data()), buf.size());
  if (!stream) {
    return RSL_UNEXPECTED("Failed to write file " + std::string(path));
  }
  return {};
}

static FlushFileHandler s_flushFileHandler = OishiiDefaultFlushFile;

void SetGlobalFileWriteFunction(FlushFileHandler handler) {
  s_flushFileHandler = handler != nullptr ? handler : OishiiDefaultFlushFile;
}

std::expected<void, std::string> FlushFile(std::span<const u8> buf,
                                           std::string_view path) {
  return s_flushFileHandler(buf, path);
}

} // namespace oishii
