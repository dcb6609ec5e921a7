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
#include "multimethod/exceptions.hpp"

#include <concepts>
#include <functional>
#include <optional>
#include <type_traits>

/**
 * \file match.hpp
 * Match statement over patterns
 *
 * \code
 * const mm::value area =
 *   mm::match {shape}
 *     .on(pat::attrs("w", "h"), [](mm::value wh) { ... })
 *     .on(pat::attr("r"), [](mm::value r) { ... })
 *     .result();
 * \endcode
 *
 * \ingroup patterns
 */


namespace mm {

/**
 * Match statement
 *
 * Cases are tried in order and the first one that succeeds wins; later cases
 * are skipped. A case whose body throws match_error counts as a failed case,
 * which is what makes nested matches (subcases()) fall through to the next
 * case of the enclosing one.
 *
 * \ingroup patterns
 */
class match {
  public:
  explicit match(value x)
  : m_value {x}
  { }

  /**
   * Value being matched
   */
  value
  subject() const noexcept
  { return m_value; }

  /**
   * Whether some case has already succeeded
   */
  bool
  matched() const noexcept
  { return m_result.has_value(); }

  /**
   * Case on a pattern
   *
   * \param p Pattern to match the subject against
   * \param body Invoked with the derived value if `p` matches
   */
  template <std::invocable<value> Body>
  match&
  on(const pattern *p, Body &&body)
  {
    if (m_result)
      return *this;
    if (const match_result m = attempt(p, m_value))
      _run([&] { return std::invoke(std::forward<Body>(body), *m); });
    return *this;
  }

  /**
   * Wildcard case
   */
  template <std::invocable<> Body>
  match&
  otherwise(Body &&body)
  {
    if (not m_result)
      _run(std::forward<Body>(body));
    return *this;
  }

  /**
   * Nested match on the same subject
   *
   * \param body Invoked with a fresh match statement; if none of its cases
   *        succeeds, this statement continues with its next case
   */
  template <std::invocable<match&> Body>
  match&
  subcases(Body &&body)
  {
    if (m_result)
      return *this;
    match inner {m_value};
    try { std::invoke(std::forward<Body>(body), inner); }
    catch (const match_error &) { return *this; }
    if (inner.m_result)
      m_result = inner.m_result;
    return *this;
  }

  /**
   * Value produced by the successful case (nil for bodies returning void)
   *
   * \throws match_error If no case succeeded
   */
  value
  result() const;

  private:
  template <typename Thunk>
  void
  _run(Thunk &&thunk)
  {
    using result_type = std::invoke_result_t<Thunk>;
    try
    {
      if constexpr (std::is_void_v<result_type>)
      {
        std::invoke(std::forward<Thunk>(thunk));
        m_result = nil;
      }
      else
        m_result = from(std::invoke(std::forward<Thunk>(thunk)));
    }
    catch (const match_error &)
    {
      // Failed case: leave the statement open for the next one
    }
  }

  private:
  value m_value;
  std::optional<value> m_result;
}; // class mm::match

} // namespace mm
