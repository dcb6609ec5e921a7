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


#include "multimethod/constructors.hpp"
#include "multimethod/combinators.hpp"
#include "multimethod/extractors.hpp"
#include "multimethod/format.hpp"
#include "multimethod/predicate.hpp"


mm::pattern_constructor
mm::identity_constructor()
{
  return [] (value spec) -> const pattern* {
    if (ispattern(spec))
      return pattern_val(spec);
    throw bad_spec {std::format("not a pattern: {}", spec), spec};
  };
}


mm::pattern_constructor
mm::equal_constructor()
{
  return [] (value spec) -> const pattern* {
    if (ispattern(spec))
      return pattern_val(spec);
    return pat::equal(spec);
  };
}


mm::pattern_constructor
mm::type_constructor()
{
  return [] (value spec) -> const pattern* {
    if (ispattern(spec))
      return pattern_val(spec);
    if (istype(spec))
      return pat::of_type(type_val(spec));
    throw bad_spec {std::format("not a type: {}", spec), spec};
  };
}


mm::pattern_constructor
mm::key_constructor(value k)
{
  const pattern *extractor = pat::key(k);
  return [extractor] (value spec) -> const pattern* {
    if (ispattern(spec))
      return pattern_val(spec);
    return pat::as_predicate(pat::compose(pat::equal(spec), extractor));
  };
}


mm::pattern_constructor
mm::attr_constructor(std::string_view name)
{
  const pattern *extractor = pat::attr(name);
  return [extractor] (value spec) -> const pattern* {
    if (ispattern(spec))
      return pattern_val(spec);
    return pat::as_predicate(pat::compose(pat::equal(spec), extractor));
  };
}


mm::pattern_constructor
mm::type_dispatch([[maybe_unused]] const arguments &args)
{ return type_constructor(); }


mm::constructor_source
mm::key_dispatch(value k)
{
  return [k] (const arguments &) { return key_constructor(k); };
}
