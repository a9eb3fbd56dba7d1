/**
 * @file platform.hpp
 * @brief OS feature macros, printf-format checking and RSB_ASSERT.
 */

#ifndef RSB_PLATFORM_HPP_
#define RSB_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

// ============================================================================
// Target OS
// ============================================================================

// The bridge drives ttys, ptys and fork/exec, so only POSIX targets get the
// serial and process layers. Linux additionally gets sysfs port discovery.
#if defined(__linux__)
#define RSB_PLATFORM_LINUX 1
#define RSB_PLATFORM_POSIX 1
#elif defined(__APPLE__) && defined(__MACH__)
#define RSB_PLATFORM_MACOS 1
#define RSB_PLATFORM_POSIX 1
#endif

// ============================================================================
// Compiler Attributes
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define RSB_PRINTF_FORMAT(fmt_pos, first_arg) \
  __attribute__((format(printf, fmt_pos, first_arg)))
#else
#define RSB_PRINTF_FORMAT(fmt_pos, first_arg)
#endif

// ============================================================================
// Debug Assertions
// ============================================================================

namespace rsb {
namespace detail {

/// Programming errors only; runtime failures go through expected<>.
[[noreturn]] inline void AssertionFailed(const char* expr, const char* file,
                                         int line) {
  (void)std::fprintf(stderr, "%s:%d: RSB_ASSERT(%s) failed\n", file, line,
                     expr);
  std::abort();
}

}  // namespace detail
}  // namespace rsb

#ifdef NDEBUG
#define RSB_ASSERT(expr) ((void)0)
#else
#define RSB_ASSERT(expr)                                                  \
  ((expr) ? static_cast<void>(0)                                          \
          : ::rsb::detail::AssertionFailed(#expr, __FILE__, __LINE__))
#endif

#endif  // RSB_PLATFORM_HPP_
