/*
 * Multimethod - Pattern-driven multiple dispatch for dynamic values
 * Copyright (C) 2025  Ivan Pidhurskyi
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */


#pragma once

#include "multimethod/pattern.hpp"
#include "multimethod/types.hpp"

#include <concepts>
#include <functional>
#include <string_view>
#include <utility>

/**
 * \file predicate.hpp
 * Patterns driven by a boolean test
 *
 * \ingroup patterns
 */


namespace mm {

/**
 * Pattern whose outcome depends only on a boolean test
 *
 * On success the matched value is returned unchanged.
 *
 * \ingroup patterns
 */
class predicate: public pattern {
  public:
  [[nodiscard]] virtual bool
  test(value x) const = 0;

  [[nodiscard]] match_result
  match(value x) const final
  {
    if (test(x))
      return x;
    return match_failure;
  }
}; // class mm::predicate


namespace detail {

[[nodiscard]] const mm::predicate*
function_predicate(std::string_view name, std::function<bool(value)> fn);

} // namespace mm::detail


namespace pat {

/**
 * Predicate defined by a boolean function
 *
 * As with pat::function(), a lookup error thrown by `fn` counts as failure.
 *
 * \param name Name shown in diagnostics
 * \param fn Test
 *
 * \ingroup patterns
 */
template <std::predicate<value> F>
[[nodiscard]] const mm::predicate*
predicate(std::string_view name, F &&fn)
{
  return detail::function_predicate(name,
      gc_function<bool(value)>(std::forward<F>(fn)));
}

/**
 * Matches values structurally equal to `v`
 *
 * \ingroup patterns
 */
[[nodiscard]] const mm::predicate*
equal(value v);

/**
 * Matches `v` itself (object identity)
 *
 * \ingroup patterns
 */
[[nodiscard]] const mm::predicate*
is(value v);

/**
 * Membership test
 *
 * For a list, `x` must be equal to one of its elements; for a table, `x` must
 * be one of its keys; for a string, `x` must be a substring of it. Any other
 * container matches nothing.
 *
 * \ingroup patterns
 */
[[nodiscard]] const mm::predicate*
in(value container);

/**
 * Matches instances of `t` and of its subtypes
 *
 * \ingroup patterns
 */
[[nodiscard]] const mm::predicate*
of_type(const type &t);

} // namespace mm::pat

} // namespace mm
