#pragma once

// AppleClang ships without std::expected; fall back to tl::expected there.
#ifdef __APPLE__
#define RSL_USE_FALLBACK_EXPECTED
#endif

#ifdef RSL_USE_FALLBACK_EXPECTED
#include <tl/expected.hpp>
namespace std {
using namespace tl;
}
#define RSL_UNEXPECTED tl::unexpected
#else
#include <expected>
#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202202L
#error "Unsupported standard library: must support std::expected"
#endif
#define RSL_UNEXPECTED std::unexpected
#endif
