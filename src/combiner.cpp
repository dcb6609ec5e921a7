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


#include "multimethod/combiner.hpp"

#include <utility>


namespace {

class first_combiner: public mm::method_combiner {
  public:
  mm::value
  combine(mm::candidate_stream &candidates) const override
  {
    const std::optional<mm::candidate> c = candidates.next();
    if (not c)
      candidates.fail();
    return c->invoke();
  }

  std::string_view
  name() const noexcept override
  { return "apply_first"; }
}; // class first_combiner


class last_combiner: public mm::method_combiner {
  public:
  mm::value
  combine(mm::candidate_stream &candidates) const override
  {
    std::optional<mm::candidate> last;
    while (std::optional<mm::candidate> c = candidates.next())
      last = std::move(c);
    if (not last)
      candidates.fail();
    return last->invoke();
  }

  std::string_view
  name() const noexcept override
  { return "apply_last"; }
}; // class last_combiner


// Results of every applicable method, in registry order
static mm::stl::vector<mm::value>
_invoke_all(mm::candidate_stream &candidates)
{
  mm::stl::vector<mm::value> results;
  while (const std::optional<mm::candidate> c = candidates.next())
    results.push_back(c->invoke());
  if (results.empty())
    candidates.fail();
  return results;
}


class all_combiner: public mm::method_combiner {
  public:
  mm::value
  combine(mm::candidate_stream &candidates) const override
  { return mm::list_of(_invoke_all(candidates)); }

  std::string_view
  name() const noexcept override
  { return "apply_all"; }
}; // class all_combiner


class fold_combiner: public mm::method_combiner {
  public:
  explicit fold_combiner(mm::reduce_operation op): m_op {std::move(op)} { }

  mm::value
  combine(mm::candidate_stream &candidates) const override
  {
    const mm::stl::vector<mm::value> results = _invoke_all(candidates);
    mm::value acc = results.front();
    for (size_t i = 1; i < results.size(); ++i)
      acc = m_op(acc, results[i]);
    return acc;
  }

  std::string_view
  name() const noexcept override
  { return "apply_reduce"; }

  private:
  mm::reduce_operation m_op;
}; // class fold_combiner

} // anonymous namespace


const mm::method_combiner*
mm::apply_first()
{
  static const method_combiner *instance = make_root<first_combiner>();
  return instance;
}

const mm::method_combiner*
mm::apply_last()
{
  static const method_combiner *instance = make_root<last_combiner>();
  return instance;
}

const mm::method_combiner*
mm::apply_all()
{
  static const method_combiner *instance = make_root<all_combiner>();
  return instance;
}

const mm::method_combiner*
mm::reduce_combiner(reduce_operation op)
{ return make<fold_combiner>(std::move(op)); }
