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
#include "multimethod/combinators.hpp"
#include "multimethod/combiner.hpp"
#include "multimethod/config.hpp"
#include "multimethod/constructors.hpp"
#include "multimethod/dispatch.hpp"
#include "multimethod/exceptions.hpp"
#include "multimethod/extractors.hpp"
#include "multimethod/format.hpp"
#include "multimethod/generic_function.hpp"
#include "multimethod/hash.hpp"
#include "multimethod/logging.hpp"
#include "multimethod/match.hpp"
#include "multimethod/pattern.hpp"
#include "multimethod/predicate.hpp"
#include "multimethod/registry.hpp"
#include "multimethod/types.hpp"
#include "multimethod/value.hpp"
