/*!
 * @file
 * @brief File helpers for endian streams.
 */

#pragma once

#include <rsl/Expected.hpp>
#include <rsl/Types.hpp>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace oishii {

std::expected<std::vector<u8>, std::string> UtilReadFile(std::string_view path);

using FlushFileHandler = std::expected<void, std::string> (*)(
    std::span<const u8> buf, std::string_view path);
void SetGlobalFileWriteFunction(FlushFileHandler handler);
std::expected<void, std::string> FlushFile(std::span<const u8> buf,
                                           std::string_view path);

} // namespace oishii
