#ifndef TAKEMUT_EXIT_ON_PANIC_HPP
#define TAKEMUT_EXIT_ON_PANIC_HPP

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <utility>
#include "config.hpp"

// exit_on_panic - Abort guard
//
// Runs a callable and returns its result. If the callable throws, the
// exception never leaves this function: a diagnostic line goes to stderr
// and the process ends with panic_exit_code.
//
// Guarantees:
// - No stack unwinding past the guard
// - No destructors, atexit handlers or static destructors run after a panic
// - Same result type as the callable (void included)

// @safe
namespace takemut {

namespace detail {

// @unsafe - terminates the process
[[noreturn]] inline void exit_after_panic(const char* what) noexcept {
    std::fprintf(stderr,
                 "takemut: panic with no value to put back (%s); exiting with status %d\n",
                 what ? what : "unknown exception", panic_exit_code);
    std::fflush(nullptr);
    std::_Exit(panic_exit_code);
}

} // namespace detail

// @safe - Never returns abnormally; a panic ends the process instead
// @lifetime: (F) -> owned
template<typename F>
auto exit_on_panic(F&& f) noexcept -> decltype(std::forward<F>(f)()) {
    try {
        return std::forward<F>(f)();
    } catch (const std::exception& e) {
        detail::exit_after_panic(e.what());
    } catch (...) {
        detail::exit_after_panic(nullptr);
    }
}

} // namespace takemut

#endif // TAKEMUT_EXIT_ON_PANIC_HPP
