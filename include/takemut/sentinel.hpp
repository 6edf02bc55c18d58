#ifndef TAKEMUT_SENTINEL_HPP
#define TAKEMUT_SENTINEL_HPP

#include <type_traits>
#include <utility>
#include "option.hpp"

// Sentinel<T> - An invalid value of T that is still safe to destroy
//
// take_no_exit() parks a sentinel in the slot while the real value is out
// being transformed. If the transformation throws, the sentinel stays
// there and the slot is still a well-formed T.
//
// A type opts in with two operations:
//   static T    new_sentinel();              - build the placeholder
//   static void release_sentinel(T&& value); - consume it after a clean run
//
// release_sentinel() may only be handed the exact value new_sentinel()
// produced for the same operation. Nothing checks this; passing anything
// else is undefined behaviour.
//
// Opting in, either way:
//   - specialize takemut::Sentinel<T> (derive from SentinelDefaults<T> to
//     get the no-op release), or TAKEMUT_SENTINEL(Type, expr) for short
//   - give T a static member `T new_sentinel()`, and optionally a member
//     `void release_sentinel() &&`

// @safe
namespace takemut {

// Default release: the sentinel is simply destroyed
template<typename T>
struct SentinelDefaults {
    // @unsafe - value must come from new_sentinel()
    static void release_sentinel(T&& value) noexcept {
        T discarded(std::move(value));
        (void)discarded;
    }
};

namespace detail {

template<typename T, typename = void>
struct has_member_new_sentinel : std::false_type {};

template<typename T>
struct has_member_new_sentinel<T, std::void_t<decltype(T::new_sentinel())>>
    : std::is_same<decltype(T::new_sentinel()), T> {};

template<typename T, typename = void>
struct has_member_release_sentinel : std::false_type {};

template<typename T>
struct has_member_release_sentinel<
    T, std::void_t<decltype(std::declval<T&&>().release_sentinel())>>
    : std::true_type {};

} // namespace detail

// Primary template: not a sentinel type unless T declares the members
template<typename T, typename = void>
struct Sentinel {};

// T declares `static T new_sentinel()` itself
template<typename T>
struct Sentinel<T, std::enable_if_t<detail::has_member_new_sentinel<T>::value>> {
    static T new_sentinel() {
        return T::new_sentinel();
    }

    // @unsafe - value must come from new_sentinel()
    static void release_sentinel(T&& value) {
        if constexpr (detail::has_member_release_sentinel<T>::value) {
            std::move(value).release_sentinel();
        } else {
            SentinelDefaults<T>::release_sentinel(std::move(value));
        }
    }
};

// Option<T>: None is the sentinel
template<typename T>
struct Sentinel<Option<T>> {
    static Option<T> new_sentinel() noexcept {
        return Option<T>(None);
    }

    // @unsafe - assumes None without checking
    static void release_sentinel(Option<T>&& value) noexcept {
        std::move(value).unchecked_unwrap_none();
    }
};

// ============================================================================
// Detection
// ============================================================================

template<typename T, typename = void>
struct is_sentinel : std::false_type {};

template<typename T>
struct is_sentinel<T, std::void_t<
    decltype(Sentinel<T>::new_sentinel()),
    decltype(Sentinel<T>::release_sentinel(std::declval<T&&>()))>>
    : std::is_same<decltype(Sentinel<T>::new_sentinel()), T> {};

template<typename T>
inline constexpr bool is_sentinel_v = is_sentinel<T>::value;

} // namespace takemut

// Convenience macro for the specialization route (use at global scope)
// Usage: TAKEMUT_SENTINEL(MyType, MyType::Invalid)
#define TAKEMUT_SENTINEL(Type, expr) \
    namespace takemut { \
        template<> struct Sentinel<Type> : SentinelDefaults<Type> { \
            static Type new_sentinel() { return (expr); } \
        }; \
    }

#endif // TAKEMUT_SENTINEL_HPP
