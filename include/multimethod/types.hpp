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

#include "multimethod/value.hpp"

#include <initializer_list>
#include <string_view>

/**
 * \file types.hpp
 * Runtime type descriptors
 *
 * Every value has a runtime type. Types form a single-inheritance tree rooted
 * at `types::any`; record types declared by the user hang below
 * `types::record` and carry the names of their fields.
 *
 * \ingroup types
 */


namespace mm {

/**
 * Field layout of a record type
 *
 * \ingroup types
 */
struct record_layout {
  stl::vector<value> fields; /**< Field names (symbols), parent's first */
}; // struct mm::record_layout


/**
 * Runtime type descriptor
 *
 * Compared by identity.
 *
 * \ingroup types
 */
struct type {
  std::string_view name;
  const type *parent; /**< Direct supertype; nullptr for `any` */
  const record_layout *layout; /**< Set for record types only */
}; // struct mm::type


/**
 * Builtin types
 *
 * \ingroup types
 */
namespace types {
extern const mm::type any;
extern const mm::type null; /**< Type of nil */
extern const mm::type boolean;
extern const mm::type number; /**< Supertype of integer and real */
extern const mm::type integer;
extern const mm::type real;
extern const mm::type string;
extern const mm::type symbol;
extern const mm::type pair;
extern const mm::type table;
extern const mm::type record; /**< Supertype of all record types */
extern const mm::type type_descriptor;
extern const mm::type pattern;
extern const mm::type pointer;
} // namespace mm::types


/**
 * Instance of a record type
 *
 * \ingroup types
 */
struct record_data {
  const type *rtype;
  stl::vector<value> fields; /**< In the order of rtype->layout->fields */
}; // struct mm::record_data


/**
 * Declare a new record type
 *
 * \param name Name of the type (diagnostics only; distinct declarations
 *        with the same name are distinct types)
 * \param fields Names of the fields introduced by this type
 * \param parent Supertype, must be `types::record` or another record type
 * \return Descriptor that lives as long as anything refers to it
 * \throws std::invalid_argument If `parent` is not a record type, or a field
 *         name repeats an inherited one
 *
 * \ingroup types
 */
[[nodiscard]] const type&
make_record_type(std::string_view name,
                 std::initializer_list<std::string_view> fields,
                 const type &parent = types::record);

/**
 * Create an instance of a record type
 *
 * \param rtype Record type
 * \param fields Field values in declaration order (inherited fields first)
 * \throws std::invalid_argument If `rtype` is not a record type or the number
 *         of fields does not match its layout
 *
 * \ingroup types
 */
[[nodiscard]] value
make_record(const type &rtype, std::initializer_list<value> fields);

/**
 * Look up a field of a record
 *
 * \param r Record (any other value simply has no fields)
 * \param name Field name
 * \param[out] result Set to the field value when found
 * \return True if `r` is a record with such field
 *
 * \ingroup types
 */
[[nodiscard]] bool
record_find(value r, std::string_view name, value &result) noexcept;

/**
 * Get a field of a record
 *
 * \throws lookup_error If `r` is not a record or has no such field
 *
 * \ingroup types
 */
[[nodiscard]] value
field(value r, std::string_view name);


/**
 * Get runtime type of a value
 *
 * \ingroup types
 */
[[nodiscard]] const type&
type_of(value x) noexcept;

/**
 * Check whether `a` is `b` or one of its descendants
 *
 * \ingroup types
 */
[[nodiscard]] bool
is_subtype(const type &a, const type &b) noexcept;

/**
 * Check whether runtime type of `x` is a subtype of `t`
 *
 * \ingroup types
 */
[[nodiscard]] inline bool
isinstance(value x, const type &t) noexcept
{ return is_subtype(type_of(x), t); }

} // namespace mm
