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
#include "multimethod/hash.hpp"
#include "multimethod/types.hpp"

using _pair_of_pointers = std::pair<void*, void*>;


namespace std {
template <>
struct hash<_pair_of_pointers> {
  size_t
  operator () (const _pair_of_pointers p) const noexcept
  {
    size_t hash = 0;
    mm::hash_combine(hash, p.first);
    mm::hash_combine(hash, p.second);
    return hash;
  }
};
}

using _memory_set = mm::stl::unordered_set<_pair_of_pointers>;


static bool
_equal(mm::value a, mm::value b, _memory_set &mem);

static bool
_equal_tables(const mm::table_data &a, const mm::table_data &b,
              _memory_set &mem)
{
  if (a.entries.size() != b.entries.size())
    return false;

  // Order of entries does not matter
  for (const auto &[akey, aval] : a.entries)
  {
    bool found = false;
    for (const auto &[bkey, bval] : b.entries)
    {
      if (_equal(akey, bkey, mem))
      {
        if (not _equal(aval, bval, mem))
          return false;
        found = true;
        break;
      }
    }
    if (not found)
      return false;
  }
  return true;
}

static bool
_equal(mm::value a, mm::value b, _memory_set &mem)
{
  if (mm::is(a, b))
    return true;

  if (mm::tag(a) != mm::tag(b))
    return false;

  switch (mm::tag(a))
  {
    case mm::tag::nil:
      return true;

    case mm::tag::boolean:
      return a->boolean == b->boolean;

    case mm::tag::integer:
      return a->integer == b->integer;

    case mm::tag::real:
      return a->real == b->real;

    case mm::tag::sym:
      // Names are interned
      return a->sym.data == b->sym.data;

    case mm::tag::str:
      return mm::str_view(a) == mm::str_view(b);

    case mm::tag::pair: {
      // Don't repeat test on same pairs of pairs (objects)
      if (not mem.emplace(&*a, &*b).second)
        return true;

      // Equal if both car and cdr are equal
      return _equal(mm::car<false>(a), mm::car<false>(b), mem) and
             _equal(mm::cdr<false>(a), mm::cdr<false>(b), mem);
    }

    case mm::tag::table:
      if (not mem.emplace(&*a, &*b).second)
        return true;
      return _equal_tables(*a->table, *b->table, mem);

    case mm::tag::record: {
      if (a->record->rtype != b->record->rtype)
        return false;
      if (not mem.emplace(&*a, &*b).second)
        return true;
      const auto &afields = a->record->fields;
      const auto &bfields = b->record->fields;
      for (size_t i = 0; i < afields.size(); ++i)
      {
        if (not _equal(afields[i], bfields[i], mem))
          return false;
      }
      return true;
    }

    case mm::tag::type:
      return a->type == b->type;

    case mm::tag::pattern:
      return a->pattern == b->pattern;

    case mm::tag::ptr:
      return a->ptr == b->ptr;
  }

  std::terminate();
}

bool
mm::equal(value a, value b)
{
  _memory_set mem;
  return _equal(a, b, mem);
}
