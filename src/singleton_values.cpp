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


#include "multimethod/value.hpp"


////////////////////////////////////////////////////////////////////////////////
//
//                             Booleans
//
static constinit
mm::object True_object {true}, False_object {false};

const mm::value mm::True {&True_object}, mm::False {&False_object};

////////////////////////////////////////////////////////////////////////////////
//
//                              Nil
//
static constinit
mm::object nil_object {mm::tag::nil};
const mm::value mm::nil {&nil_object};
