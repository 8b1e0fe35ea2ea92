#pragma once

#include "Expected.hpp"
#include <fmt/format.h>
#include <string>

// clang: Clang 9
// GCC:   GCC 12
#ifndef __FILE_NAME__
#define __FILE_NAME__ __FILE__
#endif

//! Bail out of a function returning `Result<T>` (string error) when `expr`
//! does not hold. The optional trailing argument is a short description.
#define EXPECT(expr, ...)                                                      \
  if (!(expr)) [[unlikely]] {                                                  \
    return RSL_UNEXPECTED(fmt::format("[{}:{}] {} [Internal: {}]",             \
                                      __FILE_NAME__, __LINE__,                 \
                                      std::string(__VA_OPT__(__VA_ARGS__)),    \
                                      #expr));                                 \
  }
