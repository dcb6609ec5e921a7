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


/**
 * \file groups.hpp
 * Documentation groups for the Multimethod library
 *
 * This file contains only documentation and defines the main module groups
 * for organizing the API documentation.
 */

/**
 * \defgroup memory Memory Management
 * Allocation in the collected heap and allocators for standard containers
 */

/**
 * \defgroup core Core Components
 * Dynamic values: construction, inspection, equality and printing
 */

/**
 * \defgroup types Runtime Types
 * Type descriptors, record types and subtyping
 */

/**
 * \defgroup patterns Patterns
 * Matching primitive, predicates, extractors, combinators and the match
 * statement
 */

/**
 * \defgroup dispatch Dispatch
 * Generic functions: registries, pattern constructors, candidate selection
 * and method combination
 */

/**
 * \defgroup utils Utilities
 * Formatting, logging and configuration
 */

/**
 * \defgroup containers Container Adapters
 * STL containers allocating from the collected heap
 */
