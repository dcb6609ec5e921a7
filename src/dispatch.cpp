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


#include "multimethod/dispatch.hpp"
#include "multimethod/logging.hpp"

#include <algorithm>
#include <sstream>


static std::string
_failure_message(std::string_view generic, const mm::arguments &args)
{
  std::ostringstream buf;
  buf << "no applicable method for " << generic << " with arguments " << args;
  return buf.str();
}


mm::dispatch_failure::dispatch_failure(std::string_view generic,
                                       const mm::arguments &args)
: runtime_error {_failure_message(generic, args)},
  m_generic {generic},
  m_arguments {make_shared_root<mm::arguments>(args)}
{ }


mm::candidate_stream::candidate_stream(std::string_view generic,
                                       const registry::snapshot *entries,
                                       pattern_constructor constructor,
                                       const mm::arguments &args,
                                       arity_policy arity)
: m_generic {generic},
  m_entries {entries},
  m_constructor {std::move(constructor)},
  m_args {args},
  m_arity {arity},
  m_cursor {0}
{ }


std::optional<mm::candidate>
mm::candidate_stream::next()
{
  while (m_cursor < m_entries->entries.size())
  {
    const size_t idx = m_cursor++;
    if (std::optional<candidate> c = _try_entry(m_entries->entries[idx]))
    {
      debug("{}: method #{} applies", m_generic, idx);
      return c;
    }
    debug("{}: method #{} rejected", m_generic, idx);
  }
  return std::nullopt;
}


void
mm::candidate_stream::fail() const
{
  debug("{}", _failure_message(m_generic, m_args));
  throw dispatch_failure {m_generic, m_args};
}


const mm::pattern*
mm::candidate_stream::_build(value spec) const
{
  const pattern *p = m_constructor(spec);
  if (p == nullptr)
  {
    throw bad_spec {
        std::format("{}: pattern constructor gave nothing for spec {}",
                    m_generic, spec),
        spec};
  }
  return p;
}


std::optional<mm::candidate>
mm::candidate_stream::_try_entry(const method_entry &entry) const
{
  const spec_list &specs = entry.specs;
  if (m_arity == arity_policy::strict and m_args.size() < specs.size())
    return std::nullopt;

  // Positional arguments; surplus ones pass through
  mm::arguments::positional_list positional = m_args.positional();
  const size_t n = std::min(specs.size(), positional.size());
  for (size_t i = 0; i < n; ++i)
  {
    const match_result m = attempt(_build(specs[i]), positional[i]);
    if (not m)
      return std::nullopt;
    positional[i] = *m;
  }

  // Keyword arguments; those without a spec pass through
  mm::arguments::keyword_map keywords = m_args.keywords();
  for (const auto &[name, spec] : entry.kwspecs)
  {
    const auto it = keywords.find(name);
    if (it == keywords.end())
      return std::nullopt;
    const match_result m = attempt(_build(spec), it->second);
    if (not m)
      return std::nullopt;
    it->second = *m;
  }

  return candidate {entry.impl, mm::arguments {std::move(positional),
                                               std::move(keywords)}};
}
