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


#include "multimethod/arguments.hpp"
#include "multimethod/format.hpp"


mm::value
mm::arguments::operator [] (size_t i) const
{
  if (i >= m_positional.size())
  {
    throw lookup_error {
        std::format("no positional argument #{} (got {})", i,
                    m_positional.size())};
  }
  return m_positional[i];
}


mm::value
mm::arguments::keyword(std::string_view name) const
{
  const auto it = m_keywords.find(name);
  if (it == m_keywords.end())
    throw lookup_error {std::format("no keyword argument {}", name)};
  return it->second;
}


std::ostream&
mm::operator << (std::ostream &os, const arguments &args)
{
  os << '(';
  bool first = true;
  for (const value x : args.positional())
  {
    if (not first)
      os << ' ';
    first = false;
    os << x;
  }
  for (const auto &[name, x] : args.keywords())
  {
    if (not first)
      os << ' ';
    first = false;
    os << ':' << name << ' ' << x;
  }
  return os << ')';
}
