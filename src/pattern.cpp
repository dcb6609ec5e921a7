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


#include "multimethod/pattern.hpp"
#include "multimethod/format.hpp"

#include <sstream>


std::string
mm::pattern::display() const
{
  std::ostringstream buf;
  display(buf);
  return buf.str();
}


mm::match_result
mm::attempt(const pattern *p, value x)
{
  try { return p->match(x); }
  catch (const lookup_error &) { return match_failure; }
}


mm::value
mm::getmatch(value x, const pattern *p)
{
  if (const match_result m = attempt(p, x))
    return *m;
  throw match_error {
      std::format("no pattern matches value {} ({})", x, p->display()), x};
}


namespace {

class callable_pattern: public mm::pattern {
  public:
  callable_pattern(std::string_view name,
                   std::function<mm::match_result(mm::value)> fn)
  : m_name {name}, m_fn {std::move(fn)}
  { }

  mm::match_result
  match(mm::value x) const override
  {
    try { return m_fn(x); }
    catch (const mm::lookup_error &) { return mm::match_failure; }
  }

  void
  display(std::ostream &os) const override
  { os << m_name; }

  private:
  mm::stl::string m_name;
  std::function<mm::match_result(mm::value)> m_fn;
}; // class callable_pattern


class ignore_pattern: public mm::pattern {
  public:
  mm::match_result
  match(mm::value) const override
  { return mm::nil; }

  void
  display(std::ostream &os) const override
  { os << "_"; }
}; // class ignore_pattern

} // anonymous namespace


const mm::pattern*
mm::detail::function_pattern(std::string_view name,
                             std::function<match_result(value)> fn)
{ return make<callable_pattern>(name, std::move(fn)); }


const mm::pattern*
mm::pat::ignore()
{
  static const pattern *instance = make_root<ignore_pattern>();
  return instance;
}
