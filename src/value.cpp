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


#include "multimethod/value.hpp"
#include "multimethod/exceptions.hpp"
#include "multimethod/format.hpp"
#include "multimethod/types.hpp"

#include <format>
#include <mutex>
#include <string_view>


static std::mutex g_symbols_mutex;

static
mm::stl::unordered_set<std::string_view> g_symbols;


mm::value
mm::sym(std::string_view name)
{
  std::string_view interned;
  {
    std::lock_guard lock {g_symbols_mutex};
    const auto it = g_symbols.find(name);
    if (it != g_symbols.end())
      interned = *it;
    else
    {
      char *gstr = static_cast<char*>(allocate_atomic(name.size() + 1));
      name.copy(gstr, name.size());
      gstr[name.size()] = '\0';
      interned = *g_symbols.emplace(gstr, name.size()).first;
    }
  }

  value ret {make<object>(tag::sym)};
  ret->sym.data = interned.data();
  ret->sym.len = interned.size();
  return ret;
}


mm::value
mm::from(const type &t)
{
  value ret {make<object>(tag::type)};
  ret->type = &t;
  return ret;
}


mm::value
mm::from(const pattern *p)
{
  value ret {make<object>(tag::pattern)};
  ret->pattern = p;
  return ret;
}


const mm::type&
mm::type_val(value x)
{
  if (not istype(x))
    throw std::invalid_argument {"type_val() - not a type"};
  return *x->type;
}


const mm::pattern*
mm::pattern_val(value x)
{
  if (not ispattern(x))
    throw std::invalid_argument {"pattern_val() - not a pattern"};
  return x->pattern;
}


mm::value
mm::list_ref(value l, size_t k)
{
  value result;
  if (not list_find(l, k, result))
    throw lookup_error {std::format("list_ref() - no element #{} in {}", k, l)};
  return result;
}


mm::value
mm::table(std::initializer_list<std::pair<value, value>> entries)
{
  table_data *data = make<table_data>();
  for (const auto &[k, v] : entries)
  {
    auto it = data->entries.begin();
    for (; it != data->entries.end(); ++it)
    {
      if (equal(it->first, k))
        break;
    }
    if (it != data->entries.end())
      it->second = v;
    else
      data->entries.emplace_back(k, v);
  }

  value ret {make<object>(tag::table)};
  ret->table = data;
  return ret;
}


bool
mm::table_find(value t, value k, value &result)
{
  if (not istable(t))
    return false;
  for (const auto &[key, val] : t->table->entries)
  {
    if (equal(key, k))
    {
      result = val;
      return true;
    }
  }
  return false;
}


mm::value
mm::table_ref(value t, value k)
{
  if (not istable(t))
    throw lookup_error {std::format("table_ref() - not a table: {}", t)};
  value result;
  if (not table_find(t, k, result))
    throw lookup_error {std::format("table_ref() - no key {} in {}", k, t)};
  return result;
}
