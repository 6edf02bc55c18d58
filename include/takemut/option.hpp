#ifndef TAKEMUT_OPTION_HPP
#define TAKEMUT_OPTION_HPP

#include <new>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include "config.hpp"

// Option<T> - A value that may be absent
//
// The possibly-absent container used throughout takemut, and the one type
// that ships with a Sentinel implementation (see sentinel.hpp): None is
// always safe to destroy, so it can stand in for a value while the real
// one is being transformed.
//
// Panics (unwrap/expect on None) are reported as std::runtime_error.

// @safe
namespace takemut {

// @safe
struct None_t {
    constexpr None_t() noexcept = default;
};
#if __cplusplus >= 201703L
inline constexpr None_t None{};
#else
static const None_t None{};
#endif

// @safe
template<typename T>
class Option {
    static_assert(!std::is_reference_v<T>, "Option<T> does not hold references");

private:
    bool has_value_;
    union {
        T value_;
        char empty_;
    };

    // @unsafe - caller must know the Option is Some
    void reset_unchecked() noexcept {
        value_.~T();
        has_value_ = false;
    }

public:
    Option() noexcept : has_value_(false), empty_(0) {}

    Option(None_t) noexcept : has_value_(false), empty_(0) {}

    Option(T val) : has_value_(true), value_(std::move(val)) {}

    Option(const Option& other) : has_value_(false), empty_(0) {
        if (other.has_value_) {
            new (&value_) T(other.value_);
            has_value_ = true;
        }
    }

    // The source is left as None
    Option(Option&& other) noexcept(std::is_nothrow_move_constructible_v<T>)
        : has_value_(false), empty_(0) {
        if (other.has_value_) {
            new (&value_) T(std::move(other.value_));
            has_value_ = true;
            other.reset_unchecked();
        }
    }

    Option& operator=(const Option& other) {
        if (this != &other) {
            Option copy(other);
            *this = std::move(copy);
        }
        return *this;
    }

    Option& operator=(Option&& other) noexcept(std::is_nothrow_move_constructible_v<T>) {
        if (this != &other) {
            if (has_value_) {
                reset_unchecked();
            }
            if (other.has_value_) {
                new (&value_) T(std::move(other.value_));
                has_value_ = true;
                other.reset_unchecked();
            }
        }
        return *this;
    }

    Option& operator=(None_t) noexcept {
        if (has_value_) {
            reset_unchecked();
        }
        return *this;
    }

    ~Option() {
        if (has_value_) {
            value_.~T();
        }
    }

    bool is_some() const noexcept { return has_value_; }
    bool is_none() const noexcept { return !has_value_; }

    explicit operator bool() const noexcept { return has_value_; }

    // Move the value out, leaving None. Panics on None.
    // @lifetime: owned
    T unwrap() {
        if (!has_value_) {
            throw std::runtime_error("called Option::unwrap() on a None value");
        }
        T result = std::move(value_);
        reset_unchecked();
        return result;
    }

    // @lifetime: owned
    T expect(const char* msg) {
        if (!has_value_) {
            throw std::runtime_error(msg);
        }
        return unwrap();
    }

    // @lifetime: owned
    T unwrap_or(T default_value) {
        if (has_value_) {
            return unwrap();
        }
        return default_value;
    }

    // Borrow the value. Panics on None.
    // @lifetime: (&'a) -> &'a T
    const T& unwrap_ref() const {
        if (!has_value_) {
            throw std::runtime_error("called Option::unwrap_ref() on a None value");
        }
        return value_;
    }

    // Consumes the value (this becomes None) and wraps f's result
    // @lifetime: owned
    template<typename F>
    auto map(F&& f) -> Option<std::decay_t<decltype(f(std::declval<T>()))>> {
        using U = std::decay_t<decltype(f(std::declval<T>()))>;
        if (has_value_) {
            return Option<U>(std::forward<F>(f)(unwrap()));
        }
        return Option<U>(None);
    }

    // @lifetime: owned
    Option<T> take() noexcept(std::is_nothrow_move_constructible_v<T>) {
        return Option<T>(std::move(*this));
    }

    // Put a value in, returning whatever was there before
    // @lifetime: owned
    Option<T> replace(T new_value) {
        Option<T> old = take();
        new (&value_) T(std::move(new_value));
        has_value_ = true;
        return old;
    }

    bool contains(const T& value) const {
        return has_value_ && value_ == value;
    }

    // Borrow without consuming
    // @lifetime: (&'a) -> Option<&'a T>
    Option<const T&> as_ref() const & {
        if (has_value_) {
            return Option<const T&>(value_);
        }
        return None;
    }

    // @lifetime: (&'a mut) -> Option<&'a mut T>
    Option<T&> as_mut() & {
        if (has_value_) {
            return Option<T&>(value_);
        }
        return None;
    }

    // A borrow of a temporary would dangle
    Option<const T&> as_ref() const && = delete;
    Option<T&> as_mut() && = delete;

    // @unsafe - Consumes an Option the caller knows to be None.
    // No check is performed: calling this on Some is undefined behaviour.
    void unchecked_unwrap_none() && noexcept {
        if (has_value_) {
            TAKEMUT_UNREACHABLE();
        }
    }

    friend bool operator==(const Option& lhs, const Option& rhs) {
        if (lhs.has_value_ != rhs.has_value_) {
            return false;
        }
        return !lhs.has_value_ || lhs.value_ == rhs.value_;
    }

    friend bool operator!=(const Option& lhs, const Option& rhs) {
        return !(lhs == rhs);
    }

    friend bool operator==(const Option& lhs, None_t) noexcept { return lhs.is_none(); }
    friend bool operator!=(const Option& lhs, None_t) noexcept { return lhs.is_some(); }
};

// Option<T&> - a borrow that may be absent (what as_ref()/as_mut() return)
// Holds a pointer; never owns the referent.
// @safe
template<typename T>
class Option<T&> {
private:
    T* ptr_;

public:
    Option() noexcept : ptr_(nullptr) {}
    Option(None_t) noexcept : ptr_(nullptr) {}
    Option(T& ref) noexcept : ptr_(&ref) {}

    bool is_some() const noexcept { return ptr_ != nullptr; }
    bool is_none() const noexcept { return ptr_ == nullptr; }

    explicit operator bool() const noexcept { return ptr_ != nullptr; }

    // @lifetime: (&'a) -> &'a T
    T& unwrap() const {
        if (!ptr_) {
            throw std::runtime_error("called Option::unwrap() on a None value");
        }
        return *ptr_;
    }

    // @lifetime: (&'a) -> &'a T
    T& expect(const char* msg) const {
        if (!ptr_) {
            throw std::runtime_error(msg);
        }
        return *ptr_;
    }

    template<typename F>
    auto map(F&& f) const -> Option<std::decay_t<decltype(f(std::declval<T&>()))>> {
        using U = std::decay_t<decltype(f(std::declval<T&>()))>;
        if (ptr_) {
            return Option<U>(std::forward<F>(f)(*ptr_));
        }
        return Option<U>(None);
    }

    bool contains(const T& value) const {
        return ptr_ && *ptr_ == value;
    }

    // @unsafe - same contract as Option<T>::unchecked_unwrap_none()
    void unchecked_unwrap_none() && noexcept {
        if (ptr_) {
            TAKEMUT_UNREACHABLE();
        }
    }
};

// @safe
template<typename T>
// @lifetime: owned
Option<std::decay_t<T>> Some(T&& value) {
    return Option<std::decay_t<T>>(std::forward<T>(value));
}

} // namespace takemut

#endif // TAKEMUT_OPTION_HPP
