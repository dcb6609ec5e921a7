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


#include "multimethod/combinators.hpp"

#include <algorithm>
#include <ranges>
#include <utility>


static void
_display_list(std::ostream &os, std::string_view name,
              const mm::pat::pattern_list &ps)
{
  os << name << '(';
  for (size_t i = 0; i < ps.size(); ++i)
  {
    if (i > 0)
      os << ", ";
    ps[i]->display(os);
  }
  os << ')';
}


namespace {

class all_predicate: public mm::predicate {
  public:
  explicit all_predicate(mm::pat::pattern_list ps): m_patterns {std::move(ps)} { }

  bool
  test(mm::value x) const override
  {
    return std::ranges::all_of(m_patterns,
        [x] (const mm::pattern *p) { return mm::ismatch(x, p); });
  }

  void
  display(std::ostream &os) const override
  { _display_list(os, "all", m_patterns); }

  private:
  mm::pat::pattern_list m_patterns;
}; // class all_predicate


class any_predicate: public mm::predicate {
  public:
  explicit any_predicate(mm::pat::pattern_list ps): m_patterns {std::move(ps)} { }

  bool
  test(mm::value x) const override
  {
    return std::ranges::any_of(m_patterns,
        [x] (const mm::pattern *p) { return mm::ismatch(x, p); });
  }

  void
  display(std::ostream &os) const override
  { _display_list(os, "any", m_patterns); }

  private:
  mm::pat::pattern_list m_patterns;
}; // class any_predicate


class one_of_predicate: public mm::predicate {
  public:
  explicit one_of_predicate(mm::pat::pattern_list ps)
  : m_patterns {std::move(ps)}
  { }

  bool
  test(mm::value x) const override
  {
    size_t nmatches = 0;
    for (const mm::pattern *p : m_patterns)
    {
      if (mm::ismatch(x, p) and ++nmatches > 1)
        return false;
    }
    return nmatches == 1;
  }

  void
  display(std::ostream &os) const override
  { _display_list(os, "one_of", m_patterns); }

  private:
  mm::pat::pattern_list m_patterns;
}; // class one_of_predicate


class compose_pattern: public mm::pattern {
  public:
  explicit compose_pattern(mm::pat::pattern_list ps): m_patterns {std::move(ps)} { }

  mm::match_result
  match(mm::value x) const override
  {
    mm::value acc = x;
    for (const mm::pattern *p : m_patterns | std::views::reverse)
    {
      const mm::match_result m = mm::attempt(p, acc);
      if (not m)
        return mm::match_failure;
      acc = *m;
    }
    return acc;
  }

  void
  display(std::ostream &os) const override
  { _display_list(os, "compose", m_patterns); }

  private:
  mm::pat::pattern_list m_patterns;
}; // class compose_pattern


class many_pattern: public mm::pattern {
  public:
  explicit many_pattern(mm::pat::pattern_list ps): m_patterns {std::move(ps)} { }

  mm::match_result
  match(mm::value x) const override
  {
    mm::stl::vector<mm::value> results;
    results.reserve(m_patterns.size());
    for (const mm::pattern *p : m_patterns)
    {
      const mm::match_result m = mm::attempt(p, x);
      if (not m)
        return mm::match_failure;
      results.push_back(*m);
    }
    return mm::list_of(results);
  }

  void
  display(std::ostream &os) const override
  { _display_list(os, "many", m_patterns); }

  private:
  mm::pat::pattern_list m_patterns;
}; // class many_pattern


class gate_predicate: public mm::predicate {
  public:
  explicit gate_predicate(const mm::pattern *p): m_pattern {p} { }

  bool
  test(mm::value x) const override
  { return mm::ismatch(x, m_pattern); }

  void
  display(std::ostream &os) const override
  {
    os << "as_predicate(";
    m_pattern->display(os);
    os << ')';
  }

  private:
  const mm::pattern *m_pattern;
}; // class gate_predicate


class with_pattern: public mm::pattern {
  public:
  explicit with_pattern(const mm::pattern *p): m_pattern {p} { }

  mm::match_result
  match(mm::value x) const override
  {
    if (const mm::match_result m = mm::attempt(m_pattern, x))
      return mm::list(x, *m);
    return mm::match_failure;
  }

  void
  display(std::ostream &os) const override
  {
    os << "with(";
    m_pattern->display(os);
    os << ')';
  }

  private:
  const mm::pattern *m_pattern;
}; // class with_pattern

} // anonymous namespace


const mm::predicate*
mm::pat::all(pattern_list ps)
{ return make<all_predicate>(std::move(ps)); }

const mm::predicate*
mm::pat::any(pattern_list ps)
{ return make<any_predicate>(std::move(ps)); }

const mm::predicate*
mm::pat::one_of(pattern_list ps)
{ return make<one_of_predicate>(std::move(ps)); }

const mm::pattern*
mm::pat::compose(pattern_list ps)
{ return make<compose_pattern>(std::move(ps)); }

const mm::pattern*
mm::pat::many(pattern_list ps)
{ return make<many_pattern>(std::move(ps)); }

const mm::predicate*
mm::pat::as_predicate(const pattern *p)
{ return make<gate_predicate>(p); }

const mm::pattern*
mm::pat::with(const pattern *p)
{ return make<with_pattern>(p); }
