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

#include "multimethod/logging.hpp"

/**
 * \file config.hpp
 * Process-wide configuration
 *
 * Settings live in global variables (mm::loglevel, mm::global_flags) that a
 * host program may assign directly. configure_from_environment() fills them
 * from the environment:
 *
 * - `MULTIMETHOD_LOGLEVEL`: one of silent, error, warning, info, debug;
 * - `MULTIMETHOD_FLAGS`: comma separated flag names, e.g. `StrictArity`.
 *
 * \ingroup utils
 */


namespace mm {

/**
 * Read configuration from the environment
 *
 * Variables that are not set leave the corresponding setting untouched.
 *
 * \throws std::runtime_error On an invalid loglevel name
 */
void
configure_from_environment();

} // namespace mm
