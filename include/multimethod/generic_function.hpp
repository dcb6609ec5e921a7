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
#include "multimethod/combiner.hpp"
#include "multimethod/constructors.hpp"
#include "multimethod/dispatch.hpp"
#include "multimethod/registry.hpp"

#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

/**
 * \file generic_function.hpp
 * Functions dispatching on patterns
 *
 * \code
 * mm::generic_function add {"add", mm::type_dispatch};
 * add.define(mm::specs(mm::types::integer, mm::types::integer),
 *            [](const mm::arguments &a) {
 *              return mm::integer(mm::int_val(a[0]) + mm::int_val(a[1]));
 *            });
 * add(1, 2); // => 3
 * \endcode
 *
 * \ingroup dispatch
 */


namespace mm {

/**
 * Flag in global_flags making arity_policy::strict the default for generic
 * functions declared afterwards
 *
 * \ingroup dispatch
 */
inline constexpr std::string_view strict_arity_flag = "StrictArity";


/**
 * Declaration-time settings of a generic function
 *
 * \ingroup dispatch
 */
struct generic_options {
  const method_combiner *combiner = nullptr; /**< apply_first() if not set */
  std::optional<arity_policy> arity; /**< Derived from global_flags if not set */
}; // struct mm::generic_options


/**
 * Generic function
 *
 * Owns a registry of methods and the way to turn their spec tokens into
 * patterns: either a fixed pattern constructor, or a constructor source
 * invoked with the arguments of every call.
 *
 * A generic function references values from its registry, so it must live
 * where the collector looks: static storage, the stack, or the collected
 * heap (declare_generic() allocates it there for the lifetime of the
 * process).
 *
 * \ingroup dispatch
 */
class generic_function {
  public:
  /**
   * Generic function with a fixed pattern constructor
   */
  generic_function(std::string_view name, pattern_constructor constructor,
                   generic_options options = {});

  /**
   * Generic function computing its pattern constructor for every call
   */
  generic_function(std::string_view name, constructor_source source,
                   generic_options options = {});

  /**
   * Generic function with a fixed pattern constructor given as a closure
   *
   * The closure is kept in the collected heap.
   */
  template <std::invocable<value> F>
  generic_function(std::string_view name, F &&constructor,
                   generic_options options = {})
  : generic_function {name,
        pattern_constructor {
            gc_function<const pattern*(value)>(std::forward<F>(constructor))},
        options}
  { }

  /**
   * Generic function with a constructor source given as a closure
   *
   * The closure is kept in the collected heap.
   */
  template <std::invocable<const arguments&> F>
  generic_function(std::string_view name, F &&source,
                   generic_options options = {})
  : generic_function {name,
        constructor_source {
            gc_function<pattern_constructor(const arguments&)>(
                std::forward<F>(source))},
        options}
  { }

  generic_function(const generic_function&) = delete;
  void operator = (const generic_function&) = delete;

  const std::string&
  name() const noexcept
  { return m_name; }

  const method_combiner&
  combiner() const noexcept
  { return *m_combiner; }

  arity_policy
  arity() const noexcept
  { return m_arity; }

  /** Number of registered methods */
  size_t
  size() const noexcept
  { return m_registry.size(); }

  /**
   * Register a method
   *
   * Registering under a key that already exists replaces the method without
   * changing its position in dispatch order.
   *
   * The implementation is kept in the collected heap, so values captured by
   * it stay alive as long as the method is registered.
   *
   * \param specs Positional spec tokens
   * \param kwspecs Keyword spec tokens
   * \param impl Implementation
   */
  template <std::invocable<const arguments&> F>
  void
  define(spec_list specs, keyword_specs kwspecs, F &&impl)
  {
    _define(std::move(specs), std::move(kwspecs),
            gc_function<value(const arguments&)>(std::forward<F>(impl)));
  }

  template <std::invocable<const arguments&> F>
  void
  define(spec_list specs, F &&impl)
  { define(std::move(specs), {}, std::forward<F>(impl)); }

  /**
   * Method registered under exactly these spec tokens
   *
   * \return The method, or nullptr
   */
  [[nodiscard]] const method*
  lookup(const spec_list &specs, const keyword_specs &kwspecs = {}) const
  { return m_registry.lookup(specs, kwspecs); }

  /**
   * Pattern constructor to be used for a call
   *
   * The fixed constructor if there is one; otherwise the one computed by the
   * constructor source, or identity_constructor() if it computes none.
   */
  [[nodiscard]] pattern_constructor
  resolve_constructor(const arguments &args) const;

  /**
   * Applicable methods for a call
   *
   * The stream refers to `args`, which must outlive it.
   */
  [[nodiscard]] candidate_stream
  dispatch(const arguments &args) const;

  /**
   * Call the generic function
   *
   * \throws dispatch_failure If no method applies
   */
  value
  invoke(const arguments &args) const;

  /**
   * Call the generic function with C++ values
   *
   * Arguments go through from(); use kw() for keyword arguments.
   */
  template <typename ...Args>
  value
  operator () (Args&& ...args) const
  {
    if constexpr (sizeof...(Args) == 1 and
                  (std::same_as<std::remove_cvref_t<Args>, arguments> and ...))
      return invoke(args...);
    else
      return invoke(arguments::of(std::forward<Args>(args)...));
  }

  private:
  void
  _define(spec_list specs, keyword_specs kwspecs, method impl);

  std::string m_name;
  pattern_constructor m_constructor;
  constructor_source m_source;
  const method_combiner *m_combiner;
  arity_policy m_arity;
  registry m_registry;
}; // class mm::generic_function


/**
 * \name Functional interface
 * \{
 */

namespace detail {

generic_function&
declare_generic(std::string_view name, constructor_source source,
                pattern_constructor constructor,
                const method_combiner *combiner);

} // namespace mm::detail

/**
 * Declare a generic function for the lifetime of the process
 *
 * \param name Name used in diagnostics
 * \param source Declaring callable, consulted for every call unless
 *        `constructor` is given
 * \param constructor Fixed pattern constructor
 * \param combiner Method combiner, apply_first() by default
 *
 * \ingroup dispatch
 */
template <std::invocable<const arguments&> F>
generic_function&
declare_generic(std::string_view name, F &&source,
                pattern_constructor constructor = nullptr,
                const method_combiner *combiner = nullptr)
{
  return detail::declare_generic(name,
      gc_function<pattern_constructor(const arguments&)>(std::forward<F>(source)),
      std::move(constructor), combiner);
}

/**
 * \see generic_function::define()
 *
 * \ingroup dispatch
 */
template <std::invocable<const arguments&> F>
inline void
register_method(generic_function &generic, spec_list specs,
                keyword_specs kwspecs, F &&impl)
{ generic.define(std::move(specs), std::move(kwspecs), std::forward<F>(impl)); }

/**
 * \see generic_function::invoke()
 *
 * \ingroup dispatch
 */
inline value
invoke(const generic_function &generic, const arguments &args)
{ return generic.invoke(args); }

/**
 * \see generic_function::lookup()
 *
 * \ingroup dispatch
 */
[[nodiscard]] inline const method*
lookup_method(const generic_function &generic, const spec_list &specs,
              const keyword_specs &kwspecs = {})
{ return generic.lookup(specs, kwspecs); }

/** \} */

} // namespace mm
