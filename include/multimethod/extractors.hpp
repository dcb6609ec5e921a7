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

#include <concepts>
#include <string>
#include <string_view>

/**
 * \file extractors.hpp
 * Patterns that expose parts of a value
 *
 * Subscript access (key, keys) works on tables, on lists indexed by integers
 * and on strings indexed by integers. Field access (attr, attrs) works on
 * records. A missing key and a value of the wrong shape are both plain match
 * failures.
 *
 * \ingroup patterns
 */


namespace mm::pat {

/**
 * Matches values subscriptable by `k`, exposing the element
 *
 * \ingroup patterns
 */
[[nodiscard]] const pattern*
key(value k);

/**
 * Matches values subscriptable by every key, exposing the list of elements
 *
 * \ingroup patterns
 */
[[nodiscard]] const pattern*
keys(stl::vector<value> ks);

template <typename ...Keys>
[[nodiscard]] const pattern*
keys(Keys&& ...ks)
requires (not (std::same_as<std::remove_cvref_t<Keys>, stl::vector<value>> or ...))
{ return keys(stl::vector<value> {from(std::forward<Keys>(ks))...}); }

/**
 * Matches records having a field `name`, exposing its value
 *
 * \ingroup patterns
 */
[[nodiscard]] const pattern*
attr(std::string_view name);

/**
 * Matches records having every listed field, exposing the list of values
 *
 * \ingroup patterns
 */
[[nodiscard]] const pattern*
attrs(stl::vector<std::string> names);

template <std::convertible_to<std::string_view> ...Names>
[[nodiscard]] const pattern*
attrs(const Names& ...names)
{ return attrs(stl::vector<std::string> {std::string {std::string_view {names}}...}); }

} // namespace mm::pat
