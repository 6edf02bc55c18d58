#ifndef TAKEMUT_HPP
#define TAKEMUT_HPP

// takemut - Take ownership of the value behind a mutable reference
//
// take(slot, f) moves the value out of `slot`, passes it to `f`, and moves
// f's result back in. A throwing `f` ends the process, so no caller can
// ever see a slot without a valid value.
//
// take_no_exit(slot, f) does the same for types with a Sentinel: a
// throwing `f` leaves the sentinel in `slot` and the exception propagates.
//
// Option<T> is the built-in Sentinel type (None is the sentinel).

#include "takemut/config.hpp"
#include "takemut/exit_on_panic.hpp"
#include "takemut/option.hpp"
#include "takemut/sentinel.hpp"
#include "takemut/take.hpp"

#endif // TAKEMUT_HPP
