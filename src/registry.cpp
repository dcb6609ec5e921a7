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


#include "multimethod/registry.hpp"
#include "multimethod/logging.hpp"


mm::registry::registry()
: m_snapshot {make<snapshot>()}
{ }


mm::value
mm::dispatch_key(const spec_list &specs, const keyword_specs &kwspecs)
{
  value kwpart = nil;
  for (auto it = kwspecs.rbegin(); it != kwspecs.rend(); ++it)
    kwpart = cons(cons(sym(it->first), it->second), kwpart);
  return cons(list_of(specs), kwpart);
}


bool
mm::registry::insert(spec_list specs, keyword_specs kwspecs, method impl)
{
  const value key = dispatch_key(specs, kwspecs);
  const method *newimpl = make<method>(std::move(impl));

  std::lock_guard lock {m_write_mutex};
  const snapshot *old = m_snapshot.load(std::memory_order_acquire);
  snapshot *next = make<snapshot>(*old);

  bool isnew;
  const auto it = next->index.find(key);
  if (it != next->index.end())
  {
    // Keep the original slot
    debug("redefine method {} (#{})", key, it->second);
    next->entries[it->second].impl = newimpl;
    isnew = false;
  }
  else
  {
    debug("define method {} (#{})", key, next->entries.size());
    next->index.emplace(key, next->entries.size());
    next->entries.push_back({std::move(specs), std::move(kwspecs), newimpl});
    isnew = true;
  }

  m_snapshot.store(next, std::memory_order_release);
  return isnew;
}


const mm::method*
mm::registry::lookup(const spec_list &specs, const keyword_specs &kwspecs) const
{
  const snapshot *snap = current();
  const auto it = snap->index.find(dispatch_key(specs, kwspecs));
  if (it == snap->index.end())
    return nullptr;
  return snap->entries[it->second].impl;
}
