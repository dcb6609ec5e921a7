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

#include "multimethod/value.hpp"
#include "multimethod/exceptions.hpp"
#include "multimethod/memory.hpp"

#include <concepts>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

/**
 * \file pattern.hpp
 * Matching primitive
 *
 * A pattern inspects a value and either derives a value from it or fails.
 * Failure is an ordinary result, not an exception, and is distinguishable
 * from a successful match that derives nil.
 *
 * \ingroup patterns
 */


namespace mm {

/**
 * Outcome of a match: engaged with the derived value, or empty on failure
 *
 * \ingroup patterns
 */
using match_result = std::optional<value>;

/**
 * Value of a failed match
 *
 * \ingroup patterns
 */
inline constexpr std::nullopt_t match_failure = std::nullopt;


/**
 * Pattern interface
 *
 * Implementations must be pure: the same value always gives the same result,
 * and lookup errors must be reported as failure rather than thrown.
 * Combinators only ever call match(), so any class implementing this
 * interface can be combined with the builtin ones.
 *
 * Patterns are allocated in the collected heap (see make()) and passed
 * around by `const pattern*`.
 *
 * \ingroup patterns
 */
class pattern {
  public:
  virtual
  ~pattern() = default;

  /**
   * Try to match a value
   *
   * \param x Value to match
   * \return Derived value on success, match_failure otherwise
   */
  [[nodiscard]] virtual match_result
  match(value x) const = 0;

  /**
   * Write a human readable description of the pattern
   */
  virtual void
  display(std::ostream &os) const = 0;

  [[nodiscard]] std::string
  display() const;
}; // class mm::pattern


inline std::ostream&
operator << (std::ostream &os, const pattern &p)
{ p.display(os); return os; }


/**
 * Evaluate a pattern on a value
 *
 * An mm::lookup_error escaping from the pattern is reported as failure. The
 * builtin combinators evaluate their operands through this function.
 *
 * \ingroup patterns
 */
[[nodiscard]] match_result
attempt(const pattern *p, value x);

/**
 * Check whether a pattern matches a value
 *
 * \ingroup patterns
 */
[[nodiscard]] inline bool
ismatch(value x, const pattern *p)
{ return attempt(p, x).has_value(); }

/**
 * Evaluate a pattern on a value, insisting on success
 *
 * \throws match_error If the pattern does not match
 *
 * \ingroup patterns
 */
[[nodiscard]] value
getmatch(value x, const pattern *p);


/**
 * \namespace mm::pat
 * Factories of builtin patterns
 *
 * \ingroup patterns
 */
namespace detail {

[[nodiscard]] const pattern*
function_pattern(std::string_view name, std::function<match_result(value)> fn);

} // namespace mm::detail


namespace pat {

/**
 * Pattern defined by a function
 *
 * `fn` reports failure by returning match_failure; an mm::lookup_error thrown
 * from it is turned into a failure as well, so accessors such as table_ref(),
 * list_ref() and field() may be used freely inside. Its closure is kept in
 * the collected heap (see gc_function()).
 *
 * \param name Name shown in diagnostics
 * \param fn Matching function
 *
 * \ingroup patterns
 */
template <std::invocable<value> F>
[[nodiscard]] const pattern*
function(std::string_view name, F &&fn)
{
  return detail::function_pattern(name,
      gc_function<match_result(value)>(std::forward<F>(fn)));
}

/**
 * Wildcard: matches anything and derives nil
 *
 * \ingroup patterns
 */
[[nodiscard]] const pattern*
ignore();

} // namespace mm::pat

} // namespace mm
