/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, assertion macros and string helpers.
 */

#ifndef FSUP_PLATFORM_HPP_
#define FSUP_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace fsup {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define FSUP_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define FSUP_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define FSUP_PLATFORM_WINDOWS 1
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define FSUP_LIKELY(x) __builtin_expect(!!(x), 1)
#define FSUP_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define FSUP_LIKELY(x) (x)
#define FSUP_UNLIKELY(x) (x)
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "FSUP_ASSERT failed: %s at %s:%d\n", cond, file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define FSUP_ASSERT(cond) ((void)0)
#else
#define FSUP_ASSERT(cond)                                                    \
  ((cond) ? ((void)0) : ::fsup::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// String Helpers
// ============================================================================

namespace detail {

/// ASCII case-insensitive equality of two NUL-terminated strings.
inline bool CaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    const char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    const char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    ++a;
    ++b;
  }
  return *a == *b;
}

}  // namespace detail

}  // namespace fsup

#endif  // FSUP_PLATFORM_HPP_
