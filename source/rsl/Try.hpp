#pragma once

#include <type_traits>
#include <utility>

#include <rsl/Expected.hpp>

// clang-format off
//
// Early-return on failure, otherwise evaluate to the contained value:
//
// ```cpp
//    Result<u32> ReadCount();
//    Result<u32> Twice() {
//       return TRY(ReadCount()) * 2;
//    }
// ```
//
// The error is forwarded as-is, so the enclosing function must return a
// Result with the same error type. Works for move-only values and for
// Result<void>.
//
// Relies on GNU statement expressions (GCC, Clang).
template <typename T> auto RslTryUnwrap(T&& t) {
  if constexpr (!std::is_void_v<typename std::remove_cvref_t<T>::value_type>) {
    return std::move(*t);
  }
}
#define TRY(...)                                                               \
  ({                                                                           \
    auto&& rsl_try_ = (__VA_ARGS__);                                           \
    static_assert(!std::is_lvalue_reference_v<decltype(RslTryUnwrap(rsl_try_))>); \
    if (!rsl_try_) [[unlikely]] {                                              \
      return RSL_UNEXPECTED(std::move(rsl_try_).error());                      \
    }                                                                          \
    RslTryUnwrap(rsl_try_);                                                    \
  })
// clang-format on
