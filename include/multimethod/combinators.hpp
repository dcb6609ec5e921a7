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

#include "multimethod/pattern.hpp"
#include "multimethod/predicate.hpp"

#include <concepts>

/**
 * \file combinators.hpp
 * Structural composition of patterns
 *
 * Combinators are written purely in terms of pattern::match(), so user
 * defined patterns take part in them on equal footing with the builtin ones.
 * Each factory comes in a variadic form and in a form taking a list built at
 * run time.
 *
 * \ingroup patterns
 */


namespace mm::pat {

using pattern_list = stl::vector<const pattern*>;

/**
 * Matches if every subpattern matches; returns the matched value
 *
 * With no subpatterns it matches everything.
 *
 * \ingroup patterns
 */
[[nodiscard]] const mm::predicate*
all(pattern_list ps);

template <std::convertible_to<const pattern*> ...Ps>
[[nodiscard]] const mm::predicate*
all(Ps ...ps)
{ return all(pattern_list {ps...}); }

/**
 * Matches if at least one subpattern matches; returns the matched value
 *
 * With no subpatterns it matches nothing.
 *
 * \ingroup patterns
 */
[[nodiscard]] const mm::predicate*
any(pattern_list ps);

template <std::convertible_to<const pattern*> ...Ps>
[[nodiscard]] const mm::predicate*
any(Ps ...ps)
{ return any(pattern_list {ps...}); }

/**
 * Matches if exactly one subpattern matches; returns the matched value
 *
 * With no subpatterns it matches nothing.
 *
 * \ingroup patterns
 */
[[nodiscard]] const mm::predicate*
one_of(pattern_list ps);

template <std::convertible_to<const pattern*> ...Ps>
[[nodiscard]] const mm::predicate*
one_of(Ps ...ps)
{ return one_of(pattern_list {ps...}); }

/**
 * Sequential composition
 *
 * Patterns are applied right to left, each one matching the value derived
 * by the previous one: `compose(f, g)` matches what `f` matches on the result
 * of `g`. Fails on the first failing stage. With no patterns it is the
 * identity.
 *
 * \ingroup patterns
 */
[[nodiscard]] const pattern*
compose(pattern_list ps);

template <std::convertible_to<const pattern*> ...Ps>
[[nodiscard]] const pattern*
compose(Ps ...ps)
{ return compose(pattern_list {ps...}); }

/**
 * Parallel composition
 *
 * Every pattern is matched against the same value; the result is the list of
 * derived values. Fails if any of them fails.
 *
 * \ingroup patterns
 */
[[nodiscard]] const pattern*
many(pattern_list ps);

template <std::convertible_to<const pattern*> ...Ps>
[[nodiscard]] const pattern*
many(Ps ...ps)
{ return many(pattern_list {ps...}); }

/**
 * Matches what `p` matches but returns the matched value itself
 *
 * \ingroup patterns
 */
[[nodiscard]] const mm::predicate*
as_predicate(const pattern *p);

/**
 * Matches what `p` matches, returning the list `(matched derived)`
 *
 * \ingroup patterns
 */
[[nodiscard]] const pattern*
with(const pattern *p);

} // namespace mm::pat
