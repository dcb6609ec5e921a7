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

#include <algorithm>
#include <format>
#include <functional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

/**
 * \file arguments.hpp
 * Actual arguments of a generic function call
 *
 * \ingroup dispatch
 */


namespace mm {

/**
 * Keyword argument in a call expression
 *
 * \see kw()
 *
 * \ingroup dispatch
 */
struct keyword {
  std::string name;
  value val;
}; // struct mm::keyword

/**
 * Make a keyword argument: `f(x, mm::kw("scale", 2))`
 *
 * \ingroup dispatch
 */
template <typename T>
[[nodiscard]] keyword
kw(std::string_view name, T &&x)
{ return keyword {std::string {name}, from(std::forward<T>(x))}; }


/**
 * Positional and keyword arguments of a call
 *
 * \ingroup dispatch
 */
class arguments {
  public:
  using positional_list = stl::vector<value>;
  using keyword_map = stl::map<std::string, value, std::less<>>;

  arguments() = default;

  arguments(positional_list positional, keyword_map keywords = {})
  : m_positional {std::move(positional)}, m_keywords {std::move(keywords)}
  { }

  /**
   * Build arguments from a call expression
   *
   * Every argument goes through from(), except for keyword arguments made
   * with kw() which land among the keywords.
   */
  template <typename ...Args>
  [[nodiscard]] static arguments
  of(Args&& ...args)
  {
    arguments result;
    (result._add(std::forward<Args>(args)), ...);
    return result;
  }

  /** Number of positional arguments */
  size_t
  size() const noexcept
  { return m_positional.size(); }

  /**
   * Positional argument
   *
   * \throws lookup_error If there are less than `i + 1` positional arguments
   */
  value
  operator [] (size_t i) const;

  const positional_list&
  positional() const noexcept
  { return m_positional; }

  const keyword_map&
  keywords() const noexcept
  { return m_keywords; }

  bool
  has_keyword(std::string_view name) const
  { return m_keywords.find(name) != m_keywords.end(); }

  /**
   * Keyword argument
   *
   * \throws lookup_error If there is no such keyword argument
   */
  value
  keyword(std::string_view name) const;

  void
  push_back(value x)
  { m_positional.push_back(x); }

  void
  set_keyword(std::string_view name, value x)
  { m_keywords.insert_or_assign(std::string {name}, x); }

  private:
  template <typename T>
  void
  _add(T &&x)
  {
    if constexpr (std::is_same_v<std::remove_cvref_t<T>, mm::keyword>)
      set_keyword(x.name, x.val);
    else
      push_back(from(std::forward<T>(x)));
  }

  private:
  positional_list m_positional;
  keyword_map m_keywords;
}; // class mm::arguments


/**
 * Write arguments as a list, keywords as `:name value` after the positional
 * ones
 *
 * \ingroup dispatch
 */
std::ostream&
operator << (std::ostream &os, const arguments &args);

} // namespace mm


template <>
struct std::formatter<mm::arguments, char> {
  template <class ParseContext>
  constexpr ParseContext::iterator
  parse(ParseContext &ctx)
  {
    auto it = ctx.begin();
    if (it != ctx.end() and *it != '}')
      throw std::format_error {"Invalid format arguments for mm::arguments"};
    return it;
  }

  template <class FmtContext>
  FmtContext::iterator
  format(const mm::arguments &args, FmtContext &ctx) const
  {
    std::ostringstream buffer;
    buffer << args;
    return std::ranges::copy(std::move(buffer).str(), ctx.out()).out;
  }
};
