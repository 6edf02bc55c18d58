#ifndef TAKEMUT_TAKE_HPP
#define TAKEMUT_TAKE_HPP

#include <type_traits>
#include <utility>
#include "exit_on_panic.hpp"
#include "sentinel.hpp"

// take() / take_no_exit() - Own the value behind a T& for a moment
//
// std::exchange() needs the replacement before the old value is given up.
// These functions hand the old value to a callable first and put whatever
// it returns back into the slot:
//
//   takemut::take(slot, [](Foo old) {
//       consume(std::move(old));
//       return Foo::fresh();
//   });
//
// Guarantees:
// - The callable runs exactly once
// - Outside observers only ever see the old value or the new one
// - take(): a panic ends the process (status panic_exit_code)
// - take_no_exit(): a panic leaves Sentinel<T>::new_sentinel() in the
//   slot and keeps propagating
//
// The slot must not be touched by anyone else, the callable included,
// until the call returns.

// @safe
namespace takemut {

namespace detail {

template<typename T, typename F>
struct check_transformation {
    static_assert(std::is_move_constructible_v<T> && std::is_move_assignable_v<T>,
                  "take: T must be move constructible and move assignable");
    static_assert(std::is_invocable_v<F, T&&>,
                  "take: the closure must accept the old value by value or rvalue reference");
    static_assert(std::is_convertible_v<std::invoke_result_t<F, T&&>, T>,
                  "take: the closure must return a new T");
    static constexpr bool value = true;
};

} // namespace detail

// @safe - Exits the process if the closure throws
// @lifetime: (&'a mut, F) -> void
template<typename T, typename F>
void take(T& mut_ref, F&& closure) noexcept {
    static_assert(detail::check_transformation<T, F>::value, "");
    exit_on_panic([&]() {
        // @unsafe
        {
            T old_t(std::move(mut_ref));
            T new_t = std::forward<F>(closure)(std::move(old_t));
            mut_ref = std::move(new_t);
        }
    });
}

// @safe - Leaves the sentinel behind if the closure throws
// @lifetime: (&'a mut, F) -> void
template<typename T, typename F>
void take_no_exit(T& mut_ref, F&& closure) {
    static_assert(is_sentinel_v<T>,
                  "take_no_exit: T has no Sentinel; specialize takemut::Sentinel<T> "
                  "or declare a static T::new_sentinel()");
    static_assert(detail::check_transformation<T, F>::value, "");

    T old_t = std::exchange(mut_ref, Sentinel<T>::new_sentinel());
    T new_t = std::forward<F>(closure)(std::move(old_t));
    // @unsafe { the displaced value is the sentinel installed above }
    Sentinel<T>::release_sentinel(std::exchange(mut_ref, std::move(new_t)));
}

} // namespace takemut

#endif // TAKEMUT_TAKE_HPP
