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

#include "multimethod/dispatch.hpp"

#include <concepts>
#include <functional>
#include <string_view>
#include <utility>

/**
 * \file combiner.hpp
 * Reduction of applicable methods to the result of a call
 *
 * \ingroup dispatch
 */


namespace mm {

/**
 * Method combination strategy
 *
 * Every combiner fails with dispatch_failure when the stream yields no
 * candidate at all.
 *
 * \ingroup dispatch
 */
class method_combiner {
  public:
  virtual
  ~method_combiner() = default;

  /**
   * Produce the result of a call
   *
   * \param candidates Applicable methods in registry order
   * \throws dispatch_failure If there are no candidates
   */
  [[nodiscard]] virtual value
  combine(candidate_stream &candidates) const = 0;

  [[nodiscard]] virtual std::string_view
  name() const noexcept = 0;
}; // class mm::method_combiner


/**
 * Binary operation folded by apply_reduce()
 *
 * \ingroup dispatch
 */
using reduce_operation = std::function<value(value acc, value x)>;

/**
 * Invoke the earliest registered applicable method
 *
 * Later entries are not examined.
 *
 * \ingroup dispatch
 */
[[nodiscard]] const method_combiner*
apply_first();

/**
 * Invoke the latest registered applicable method
 *
 * \ingroup dispatch
 */
[[nodiscard]] const method_combiner*
apply_last();

/**
 * Invoke every applicable method in registry order; the result is the list
 * of their results
 *
 * \ingroup dispatch
 */
[[nodiscard]] const method_combiner*
apply_all();

/**
 * Combiner folding with `op` as it is
 *
 * \see apply_reduce()
 *
 * \ingroup dispatch
 */
[[nodiscard]] const method_combiner*
reduce_combiner(reduce_operation op);

/**
 * Like apply_all(), then fold the results from the left with `op`, the first
 * result being the seed
 *
 * `op` is kept in the collected heap.
 *
 * \ingroup dispatch
 */
template <typename F>
requires std::invocable<F, value, value>
[[nodiscard]] const method_combiner*
apply_reduce(F &&op)
{ return reduce_combiner(gc_function<value(value, value)>(std::forward<F>(op))); }

} // namespace mm
