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


#pragma once

#include "multimethod/arguments.hpp"
#include "multimethod/pattern.hpp"
#include "multimethod/types.hpp"

#include <functional>
#include <string_view>

/**
 * \file constructors.hpp
 * Turning spec tokens into patterns
 *
 * Methods are registered with spec tokens: arbitrary values whose meaning is
 * given by the pattern constructor of the generic function. A constructor
 * can be fixed when the generic is declared or computed anew for every call
 * by a constructor source (the declaring callable of the generic).
 *
 * Builtin constructors accept pattern values as tokens and use them as they
 * are, so explicit patterns can be mixed with declarative tokens.
 *
 * \ingroup dispatch
 */


namespace mm {

/**
 * Maps a spec token to the pattern that the corresponding argument is
 * matched against
 *
 * \ingroup dispatch
 */
using pattern_constructor = std::function<const pattern*(value spec)>;

/**
 * Computes the pattern constructor for a call from its arguments
 *
 * Returning an empty constructor selects identity_constructor().
 *
 * \ingroup dispatch
 */
using constructor_source = std::function<pattern_constructor(const arguments &args)>;


/**
 * Spec tokens are patterns
 *
 * \throws bad_spec When called with a token that is not a pattern
 *
 * \ingroup dispatch
 */
[[nodiscard]] pattern_constructor
identity_constructor();

/**
 * Token `v` becomes `pat::equal(v)`
 *
 * \ingroup dispatch
 */
[[nodiscard]] pattern_constructor
equal_constructor();

/**
 * Token must be a type `T` and becomes `pat::of_type(T)`
 *
 * \throws bad_spec When called with a token that is neither a type nor a
 *         pattern
 *
 * \ingroup dispatch
 */
[[nodiscard]] pattern_constructor
type_constructor();

/**
 * Token `v` becomes `pat::as_predicate(pat::compose(pat::equal(v),
 * pat::key(k)))`: the argument must have `v` under key `k`, and is passed to
 * the method unchanged
 *
 * \ingroup dispatch
 */
[[nodiscard]] pattern_constructor
key_constructor(value k);

/**
 * Token `v` becomes `pat::as_predicate(pat::compose(pat::equal(v),
 * pat::attr(name)))`: the argument must be a record whose field `name`
 * equals `v`, and is passed to the method unchanged
 *
 * \ingroup dispatch
 */
[[nodiscard]] pattern_constructor
attr_constructor(std::string_view name);


/**
 * Constructor source dispatching on types, whatever the call
 *
 * \ingroup dispatch
 */
[[nodiscard]] pattern_constructor
type_dispatch(const arguments &args);

/**
 * Constructor source dispatching on the value under key `k`, whatever the
 * call
 *
 * \ingroup dispatch
 */
[[nodiscard]] constructor_source
key_dispatch(value k);

} // namespace mm
