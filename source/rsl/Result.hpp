#pragma once

#include "Expected.hpp"
#include <string>

//! Fallible return value. Errors default to a human readable message; the
//! codec layers substitute their own structured error type.
template <typename T, typename E = std::string>
using Result = std::expected<T, E>;
