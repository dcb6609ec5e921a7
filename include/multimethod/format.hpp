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

#include <algorithm>
#include <format>
#include <sstream>

/**
 * \file format.hpp
 * std::format support for values
 *
 * `{}` and `{:w}` write a value (strings quoted), `{:d}` displays it.
 *
 * \ingroup utils
 */


namespace std {

/**
 * Formatter for mm::value
 *
 * \ingroup utils
 */
template <>
struct formatter<mm::value, char> {
  enum class style { write, display } style = style::write;

  template <class ParseContext>
  constexpr ParseContext::iterator
  parse(ParseContext &ctx)
  {
    auto it = ctx.begin();
    if (it != ctx.end() and *it == 'w')
    {
      style = style::write;
      it++;
    }
    else if (it != ctx.end() and *it == 'd')
    {
      style = style::display;
      it++;
    }

    if (it != ctx.end() and *it != '}')
      throw std::format_error {"Invalid format arguments for mm::value"};

    return it;
  }

  template <class FmtContext>
  FmtContext::iterator
  format(mm::value x, FmtContext &ctx) const
  {
    std::ostringstream buffer;
    switch (style)
    {
      case style::write: mm::write(buffer, x); break;
      case style::display: mm::display(buffer, x); break;
    }
    return std::ranges::copy(std::move(buffer).str(), ctx.out()).out;
  }
};

} // namespace std
