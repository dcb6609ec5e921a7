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


#include "multimethod/extractors.hpp"
#include "multimethod/types.hpp"

#include <utility>


// Subscript `x` by `k`; negative integer indices count from the end
static mm::match_result
_subscript(mm::value x, mm::value k)
{
  using namespace mm;
  value result;
  switch (tag(x))
  {
    case tag::table:
      if (table_find(x, k, result))
        return result;
      return match_failure;

    case tag::nil:
    case tag::pair: {
      if (not isint(k))
        return match_failure;
      long long idx = int_val(k);
      if (idx < 0)
        idx += static_cast<long long>(length(x));
      if (idx >= 0 and list_find(x, static_cast<size_t>(idx), result))
        return result;
      return match_failure;
    }

    case tag::str: {
      if (not isint(k))
        return match_failure;
      const std::string_view s = str_view(x);
      long long idx = int_val(k);
      if (idx < 0)
        idx += static_cast<long long>(s.size());
      if (idx < 0 or idx >= static_cast<long long>(s.size()))
        return match_failure;
      return str(s.substr(idx, 1));
    }

    default:
      return match_failure;
  }
}


namespace {

class key_pattern: public mm::pattern {
  public:
  explicit key_pattern(mm::value k): m_key {k} { }

  mm::match_result
  match(mm::value x) const override
  { return _subscript(x, m_key); }

  void
  display(std::ostream &os) const override
  { os << "key(" << m_key << ')'; }

  private:
  mm::value m_key;
}; // class key_pattern


class keys_pattern: public mm::pattern {
  public:
  explicit keys_pattern(mm::stl::vector<mm::value> ks): m_keys {std::move(ks)} { }

  mm::match_result
  match(mm::value x) const override
  {
    mm::stl::vector<mm::value> results;
    results.reserve(m_keys.size());
    for (const mm::value k : m_keys)
    {
      const mm::match_result m = _subscript(x, k);
      if (not m)
        return mm::match_failure;
      results.push_back(*m);
    }
    return mm::list_of(results);
  }

  void
  display(std::ostream &os) const override
  { os << "keys" << mm::list_of(m_keys); }

  private:
  mm::stl::vector<mm::value> m_keys;
}; // class keys_pattern


class attr_pattern: public mm::pattern {
  public:
  explicit attr_pattern(std::string_view name): m_name {mm::sym(name)} { }

  mm::match_result
  match(mm::value x) const override
  {
    mm::value result;
    if (mm::record_find(x, mm::sym_name(m_name), result))
      return result;
    return mm::match_failure;
  }

  void
  display(std::ostream &os) const override
  { os << "attr(" << mm::sym_name(m_name) << ')'; }

  private:
  mm::value m_name; /**< Field name as a symbol */
}; // class attr_pattern


class attrs_pattern: public mm::pattern {
  public:
  explicit attrs_pattern(const mm::stl::vector<std::string> &names)
  {
    for (const std::string &name : names)
      m_names.push_back(mm::sym(name));
  }

  mm::match_result
  match(mm::value x) const override
  {
    mm::stl::vector<mm::value> results;
    results.reserve(m_names.size());
    for (const mm::value name : m_names)
    {
      mm::value result;
      if (not mm::record_find(x, mm::sym_name(name), result))
        return mm::match_failure;
      results.push_back(result);
    }
    return mm::list_of(results);
  }

  void
  display(std::ostream &os) const override
  { os << "attrs" << mm::list_of(m_names); }

  private:
  mm::stl::vector<mm::value> m_names;
}; // class attrs_pattern

} // anonymous namespace


const mm::pattern*
mm::pat::key(value k)
{ return make<key_pattern>(k); }

const mm::pattern*
mm::pat::keys(stl::vector<value> ks)
{ return make<keys_pattern>(std::move(ks)); }

const mm::pattern*
mm::pat::attr(std::string_view name)
{ return make<attr_pattern>(name); }

const mm::pattern*
mm::pat::attrs(stl::vector<std::string> names)
{ return make<attrs_pattern>(names); }
