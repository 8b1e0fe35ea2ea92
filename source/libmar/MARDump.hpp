#pragma once

#include <core/common.h>
#include <libmar/MAR.hpp>

namespace libmar {

//! `ls`-style permission string for the low nine bits, e.g. "-rwxr-xr-x".
std::string FormatPermissions(u32 flags);

//! "Product Information" for known block ids, "<id> (unknown)" otherwise.
std::string BlockIdName(u32 block_id);

//! Upper-case hex of the first |max_bytes| bytes, with a trailing ellipsis if
//! truncated.
std::string HexPreview(rsl::byte_view data, size_t max_bytes = 32);

//! Multi-line human readable description of every parsed structure.
std::string DescribeArchive(const Archive& arc);

//! One line per index entry.
std::string ListIndex(const Archive& arc);

} // namespace libmar
