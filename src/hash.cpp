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


#include "multimethod/hash.hpp"
#include "multimethod/types.hpp"

#include <string_view>


using _memory_set = mm::stl::unordered_set<void*>;


// Marks a node as being on the current path from the root. Only a node met
// again on its own path closes a cycle; shared substructure is hashed in full.
class _on_path {
  public:
  _on_path(void *node, _memory_set &path)
  : m_node {node}, m_path {path}, m_cycle {not path.emplace(node).second}
  { }

  ~_on_path()
  {
    if (not m_cycle)
      m_path.erase(m_node);
  }

  _on_path(const _on_path&) = delete;
  void operator = (const _on_path&) = delete;

  bool
  cycle() const noexcept
  { return m_cycle; }

  private:
  void *m_node;
  _memory_set &m_path;
  bool m_cycle;
}; // class _on_path


static size_t
_hash(mm::value x, _memory_set &mem)
{
  switch (mm::tag(x))
  {
    case mm::tag::nil:
      return 0x12345678;

    case mm::tag::boolean:
      return x->boolean ? 0x1 : 0x2;

    case mm::tag::integer:
      return std::hash<long long> {}(x->integer);

    case mm::tag::real:
      return std::hash<double> {}(x->real) ^ 0x5bd1e995;

    case mm::tag::sym:
      return std::hash<const void*> {}(x->sym.data);

    case mm::tag::str:
      return std::hash<std::string_view> {}(mm::str_view(x));

    case mm::tag::pair: {
      const _on_path guard {&*x, mem};
      if (guard.cycle())
        return 0;
      size_t hash = _hash(mm::car<false>(x), mem);
      hash ^= _hash(mm::cdr<false>(x), mem) + 0x9e3779b9 + (hash<<6) + (hash>>2);
      return hash;
    }

    case mm::tag::table: {
      const _on_path guard {&*x, mem};
      if (guard.cycle())
        return 0;
      // Commutative, since equality ignores the order of entries
      size_t hash = x->table->entries.size();
      for (const auto &[key, val] : x->table->entries)
      {
        size_t entry = _hash(key, mem);
        entry ^= _hash(val, mem) + 0x9e3779b9 + (entry<<6) + (entry>>2);
        hash += entry;
      }
      return hash;
    }

    case mm::tag::record: {
      const _on_path guard {&*x, mem};
      if (guard.cycle())
        return 0;
      size_t hash = std::hash<const void*> {}(x->record->rtype);
      for (const mm::value field : x->record->fields)
        hash ^= _hash(field, mem) + 0x9e3779b9 + (hash<<6) + (hash>>2);
      return hash;
    }

    case mm::tag::type:
      return std::hash<const void*> {}(x->type);

    case mm::tag::pattern:
      return std::hash<const void*> {}(x->pattern);

    case mm::tag::ptr:
      return std::hash<void*> {}(x->ptr);
  }

  std::terminate();
}

size_t
mm::hash(value x)
{
  _memory_set mem;
  return _hash(x, mem);
}
