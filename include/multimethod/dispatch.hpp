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
#include "multimethod/constructors.hpp"
#include "multimethod/registry.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

/**
 * \file dispatch.hpp
 * Selection of applicable methods for a call
 *
 * \ingroup dispatch
 */


namespace mm {

/**
 * What to do when a call has fewer positional arguments than a method has
 * positional spec tokens
 *
 * \ingroup dispatch
 */
enum class arity_policy {
  lenient, /**< Unmatched trailing specs are not evaluated; the method may apply */
  strict,  /**< The method does not apply */
};


/**
 * No registered method applies to a call
 *
 * \ingroup dispatch
 */
struct dispatch_failure: std::runtime_error {
  dispatch_failure(std::string_view generic, const mm::arguments &args);

  /** Name of the generic function */
  const std::string&
  generic() const noexcept
  { return m_generic; }

  /** Arguments of the failed call, as they were passed */
  const mm::arguments&
  arguments() const noexcept
  { return *m_arguments; }

  private:
  std::string m_generic;
  std::shared_ptr<const mm::arguments> m_arguments;
}; // struct mm::dispatch_failure


/**
 * Applicable method with the arguments to invoke it with
 *
 * Each argument is replaced by the value derived by its pattern; arguments
 * without a spec are passed through.
 *
 * \ingroup dispatch
 */
struct candidate {
  const method *impl;
  mm::arguments args;

  value
  invoke() const
  { return (*impl)(args); }
}; // struct mm::candidate


/**
 * Lazy sequence of candidates for one call
 *
 * Entries of the registry snapshot are examined in order, one per
 * candidate requested: patterns of an entry are built and evaluated only
 * when the consumer asks for the next candidate.
 *
 * \ingroup dispatch
 */
class candidate_stream {
  public:
  candidate_stream(std::string_view generic, const registry::snapshot *entries,
                   pattern_constructor constructor, const mm::arguments &args,
                   arity_policy arity);

  /**
   * Next applicable method
   *
   * \return The candidate, or nullopt when the registry is exhausted
   * \throws bad_spec If the pattern constructor rejects a spec token
   */
  [[nodiscard]] std::optional<candidate>
  next();

  /** Name of the generic function being dispatched */
  std::string_view
  generic() const noexcept
  { return m_generic; }

  /** Arguments of the call */
  const mm::arguments&
  arguments() const noexcept
  { return m_args; }

  /**
   * Signal that the call has no applicable method
   *
   * \throws dispatch_failure Always
   */
  [[noreturn]] void
  fail() const;

  private:
  std::optional<candidate>
  _try_entry(const method_entry &entry) const;

  const pattern*
  _build(value spec) const;

  private:
  std::string_view m_generic;
  const registry::snapshot *m_entries;
  pattern_constructor m_constructor;
  const mm::arguments &m_args;
  arity_policy m_arity;
  size_t m_cursor;
}; // class mm::candidate_stream

} // namespace mm
