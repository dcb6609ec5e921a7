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

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>


namespace mm {

/**
 * Missing key, field or index
 *
 * Thrown by accessors such as table_ref() and field(). Patterns never let it
 * escape: inside a pattern it is an ordinary match failure.
 *
 * \ingroup core
 */
struct lookup_error: std::runtime_error {
  using runtime_error::runtime_error;
}; // struct mm::lookup_error


/**
 * No pattern matches a value
 *
 * Thrown by getmatch() and by a match statement that ran out of cases.
 *
 * \ingroup patterns
 */
struct match_error: std::runtime_error {
  match_error(std::string_view what, value x)
  : runtime_error {std::string {what}},
    m_value {make_shared_root<value>(x)}
  { }

  value
  matched() const noexcept
  { return *m_value; }

  private:
  std::shared_ptr<value> m_value;
}; // struct mm::match_error


/**
 * Spec token that a pattern constructor can not interpret
 *
 * \ingroup dispatch
 */
struct bad_spec: std::invalid_argument {
  bad_spec(std::string_view what, value spec)
  : invalid_argument {std::string {what}},
    m_spec {make_shared_root<value>(spec)}
  { }

  value
  spec() const noexcept
  { return *m_spec; }

  private:
  std::shared_ptr<value> m_spec;
}; // struct mm::bad_spec

} // namespace mm
