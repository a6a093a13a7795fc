#pragma once

#include <cstdlib>
#include <iostream>

#ifdef __has_attribute
#define WG_HAS_ATTRIBUTE(x) __has_attribute(x)
#else
#define WG_HAS_ATTRIBUTE(x) 0
#endif

#if WG_HAS_ATTRIBUTE(always_inline) || \
    (defined(__GNUC__) && !defined(__clang__))
#define WG_ALWAYS_INLINE __attribute__((always_inline))
#else
#define WG_ALWAYS_INLINE
#endif

#if WG_HAS_ATTRIBUTE(guarded_by)
#define WG_GUARDED_BY(mu) __attribute__((guarded_by(mu)))
#else
#define WG_GUARDED_BY(mu)
#endif

#if WG_HAS_ATTRIBUTE(locks_excluded)
#define WG_LOCKS_EXCLUDED(...) __attribute__((locks_excluded(__VA_ARGS__)))
#else
#define WG_LOCKS_EXCLUDED(...)
#endif

#if defined(NDEBUG) && defined(__clang__)

#define WG_ASSERT_MSG(cond, message)              \
  _Pragma("GCC diagnostic push");                 \
  _Pragma("GCC diagnostic ignored \"-Wassume\""); \
  __builtin_assume(cond);                         \
  _Pragma("GCC diagnostic pop")

#elif defined(NDEBUG)

#define WG_ASSERT_MSG(cond, message) \
  do {                               \
    if (!(cond)) {                   \
      __builtin_unreachable();       \
    }                                \
  } while (0)

#else

#define WG_ASSERT_MSG(cond, message)                                        \
  do {                                                                      \
    /* NOLINTNEXTLINE(readability-simplify-boolean-expr) */                 \
    if (!(cond)) {                                                          \
      std::cerr                                                             \
          << __FILE__ ":" << __LINE__ << ": Condition failed: " #cond ", "  \
          << message /* NOLINT(bugprone-macro-parentheses) */ << std::endl; \
      std::abort();                                                         \
    }                                                                       \
  } while (0)

#endif

// clang-format off
#define WG_ASSERT_INFIX(a, b, op, neg) \
  WG_ASSERT_MSG((a) op (b), (a) << (" " #neg " ") << (b))
// clang-format on

#define WG_ASSERT_LT(a, b) WG_ASSERT_INFIX(a, b, <, >=)

#define WG_EXPECT_FALSE(cond) __builtin_expect((long) (cond), (long) 0)
