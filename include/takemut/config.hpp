#ifndef TAKEMUT_CONFIG_HPP
#define TAKEMUT_CONFIG_HPP

// Compile-time configuration for takemut
//
// TAKEMUT_PANIC_EXIT_CODE
//   Status the process exits with when a transformation passed to take()
//   throws. Must be in 1..255 (exit statuses are reported modulo 256);
//   101 is the default.
//
// TAKEMUT_UNREACHABLE()
//   Tells the optimizer a code path can never be reached. Reaching it is
//   undefined behaviour. On compilers without a hint it expands to nothing,
//   so it never turns into a runtime check.

#ifndef TAKEMUT_PANIC_EXIT_CODE
#define TAKEMUT_PANIC_EXIT_CODE 101
#endif

#if defined(__GNUC__) || defined(__clang__)
#define TAKEMUT_UNREACHABLE() __builtin_unreachable()
#elif defined(_MSC_VER)
#define TAKEMUT_UNREACHABLE() __assume(0)
#else
#define TAKEMUT_UNREACHABLE() ((void)0)
#endif

namespace takemut {

static_assert(TAKEMUT_PANIC_EXIT_CODE > 0 && TAKEMUT_PANIC_EXIT_CODE < 256,
              "TAKEMUT_PANIC_EXIT_CODE must be a nonzero exit status below 256");

inline constexpr int panic_exit_code = TAKEMUT_PANIC_EXIT_CODE;

} // namespace takemut

#endif // TAKEMUT_CONFIG_HPP
