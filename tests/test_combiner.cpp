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
#include "multimethod/generic_function.hpp"
#include "multimethod/predicate.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>


class CombinerTest: public testing::Test {
  protected:
  // Generic over numbers with three applicable methods for an integer
  void
  define_methods(mm::generic_function &f)
  {
    f.define(mm::specs(mm::types::integer), [this] (const mm::arguments &) {
      invoked.push_back(1);
      return mm::integer(1);
    });
    f.define(mm::specs(mm::types::string), [this] (const mm::arguments &) {
      invoked.push_back(2);
      return mm::integer(2);
    });
    f.define(mm::specs(mm::types::number), [this] (const mm::arguments &) {
      invoked.push_back(3);
      return mm::integer(3);
    });
    f.define(mm::specs(mm::types::any), [this] (const mm::arguments &) {
      invoked.push_back(4);
      return mm::integer(4);
    });
  }

  std::vector<int> invoked;
};

// apply_first invokes only the earliest applicable method
TEST_F(CombinerTest, ApplyFirst)
{
  mm::generic_function f {"f", mm::type_constructor()};
  define_methods(f);

  EXPECT_STREQ(f.combiner().name().data(), "apply_first");
  EXPECT_TRUE(mm::equal(f(10), mm::integer(1)));
  EXPECT_EQ(invoked, (std::vector<int> {1}));
}

// apply_last invokes only the latest applicable method
TEST_F(CombinerTest, ApplyLast)
{
  mm::generic_function f {"f", mm::type_constructor(),
                          {.combiner = mm::apply_last()}};
  define_methods(f);

  EXPECT_TRUE(mm::equal(f(10), mm::integer(4)));
  EXPECT_EQ(invoked, (std::vector<int> {4}));
}

TEST_F(CombinerTest, ApplyAll)
{
  mm::generic_function f {"f", mm::type_constructor(),
                          {.combiner = mm::apply_all()}};
  define_methods(f);

  EXPECT_TRUE(mm::equal(f(10), mm::list(1, 3, 4)));
  EXPECT_EQ(invoked, (std::vector<int> {1, 3, 4}));

  invoked.clear();
  EXPECT_TRUE(mm::equal(f("s"), mm::list(2, 4)));
}

// Sum of the results of every applicable method
TEST_F(CombinerTest, ApplyReduce)
{
  const mm::method_combiner *sum = mm::apply_reduce([] (mm::value acc, mm::value x) {
    return mm::integer(mm::int_val(acc) + mm::int_val(x));
  });
  mm::generic_function f {"f", mm::type_constructor(), {.combiner = sum}};
  define_methods(f);

  EXPECT_TRUE(mm::equal(f(10), mm::integer(8)));
  EXPECT_TRUE(mm::equal(f(mm::real(1.5)), mm::integer(7)));
  EXPECT_TRUE(mm::equal(f(mm::nil), mm::integer(4)));
}

// The fold runs from the left with the first result as the seed
TEST_F(CombinerTest, ReduceOrder)
{
  const mm::method_combiner *collect = mm::apply_reduce([] (mm::value acc, mm::value x) {
    return mm::list(acc, x);
  });
  mm::generic_function f {"f", mm::type_constructor(), {.combiner = collect}};
  define_methods(f);

  EXPECT_TRUE(mm::equal(f(10), mm::list(mm::list(1, 3), 4)));
}

// Every combiner fails on an empty candidate stream
TEST_F(CombinerTest, EmptyStream)
{
  const mm::method_combiner *sum = mm::apply_reduce([] (mm::value acc, mm::value) {
    return acc;
  });
  for (const mm::method_combiner *combiner :
       {mm::apply_first(), mm::apply_last(), mm::apply_all(), sum})
  {
    mm::generic_function f {"empty", mm::type_constructor(),
                            {.combiner = combiner}};
    f.define(mm::specs(mm::types::string), [] (const mm::arguments &) {
      return mm::nil;
    });
    EXPECT_THROW(std::ignore = f(1), mm::dispatch_failure) << combiner->name();
  }
}

// Exceptions raised by methods propagate unchanged
TEST_F(CombinerTest, MethodExceptions)
{
  mm::generic_function f {"f", mm::type_constructor(),
                          {.combiner = mm::apply_all()}};
  f.define(mm::specs(mm::types::integer), [] (const mm::arguments &) -> mm::value {
    throw std::logic_error {"method failed"};
  });
  EXPECT_THROW(std::ignore = f(1), std::logic_error);
}
