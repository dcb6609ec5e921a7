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


#include "multimethod/generic_function.hpp"
#include "multimethod/logging.hpp"


static mm::arity_policy
_default_arity()
{
  if (mm::global_flags.contains(std::string {mm::strict_arity_flag}))
    return mm::arity_policy::strict;
  return mm::arity_policy::lenient;
}


mm::generic_function::generic_function(std::string_view name,
                                       pattern_constructor constructor,
                                       generic_options options)
: m_name {name},
  m_constructor {std::move(constructor)},
  m_source {nullptr},
  m_combiner {options.combiner ? options.combiner : apply_first()},
  m_arity {options.arity.value_or(_default_arity())}
{ }


mm::generic_function::generic_function(std::string_view name,
                                       constructor_source source,
                                       generic_options options)
: m_name {name},
  m_constructor {nullptr},
  m_source {std::move(source)},
  m_combiner {options.combiner ? options.combiner : apply_first()},
  m_arity {options.arity.value_or(_default_arity())}
{ }


void
mm::generic_function::_define(spec_list specs, keyword_specs kwspecs,
                              method impl)
{
  debug("{}: register method", m_name);
  indent logindent;
  m_registry.insert(std::move(specs), std::move(kwspecs), std::move(impl));
}


mm::pattern_constructor
mm::generic_function::resolve_constructor(const arguments &args) const
{
  if (m_constructor)
    return m_constructor;

  if (m_source)
  {
    if (pattern_constructor constructor = m_source(args))
      return constructor;
  }

  debug("{}: no pattern constructor for {}, using identity", m_name, args);
  return identity_constructor();
}


mm::candidate_stream
mm::generic_function::dispatch(const arguments &args) const
{
  return candidate_stream {m_name, m_registry.current(),
                           resolve_constructor(args), args, m_arity};
}


mm::value
mm::generic_function::invoke(const arguments &args) const
{
  debug("{}: call with {} ({})", m_name, args, m_combiner->name());
  indent logindent;
  candidate_stream candidates = dispatch(args);
  return m_combiner->combine(candidates);
}


mm::generic_function&
mm::detail::declare_generic(std::string_view name, constructor_source source,
                            pattern_constructor constructor,
                            const method_combiner *combiner)
{
  generic_options options;
  options.combiner = combiner;
  if (constructor)
    return *make_root<generic_function>(name, std::move(constructor), options);
  return *make_root<generic_function>(name, std::move(source), options);
}
