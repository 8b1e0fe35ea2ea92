#pragma once

#include <cstdint>
#include <span>

using s8 = std::int8_t;
using s16 = std::int16_t;
using s32 = std::int32_t;
using s64 = std::int64_t;
using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

static_assert(sizeof(u64) == 8 && sizeof(s64) == 8);

namespace rsl {

//! Read-only view of raw file bytes. Never owns the data.
using byte_view = std::span<const u8>;

} // namespace rsl
