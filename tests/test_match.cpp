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


#include "multimethod/combinators.hpp"
#include "multimethod/extractors.hpp"
#include "multimethod/match.hpp"
#include "multimethod/predicate.hpp"

#include <gtest/gtest.h>
#include <string>
#include <tuple>

namespace pat = mm::pat;


// Test fixture for match tests
class MatchTest: public testing::Test {
  protected:
  void
  SetUp() override
  {
    rectangle = &mm::make_record_type("rectangle", {"w", "h"});
    circle = &mm::make_record_type("circle", {"r"});
  }

  // Area of a shape, dispatching on its fields
  mm::value
  area(mm::value shape) const
  {
    return mm::match {shape}
      .on(pat::attrs("w", "h"), [] (mm::value wh) {
        return mm::num_val(mm::car(wh)) * mm::num_val(mm::car(mm::cdr(wh)));
      })
      .on(pat::attr("r"), [] (mm::value r) {
        return 3.0 * mm::num_val(r) * mm::num_val(r);
      })
      .result();
  }

  const mm::type *rectangle;
  const mm::type *circle;
};

// The first succeeding case wins and receives the derived value
TEST_F(MatchTest, FirstMatchingCase)
{
  EXPECT_TRUE(mm::equal(area(mm::make_record(*rectangle, {mm::integer(2),
                                                          mm::integer(3)})),
                        mm::real(6)));
  EXPECT_TRUE(mm::equal(area(mm::make_record(*circle, {mm::integer(1)})),
                        mm::real(3)));
}

TEST_F(MatchTest, NoMatchingCase)
{
  try
  {
    std::ignore = area(mm::integer(1));
    FAIL() << "match_error expected";
  }
  catch (const mm::match_error &exn)
  {
    EXPECT_TRUE(mm::equal(exn.matched(), mm::integer(1)));
    EXPECT_NE(std::string {exn.what()}.find("no pattern matches value"),
              std::string::npos);
  }
}

// Later cases are not evaluated once one has succeeded
TEST_F(MatchTest, LaterCasesSkipped)
{
  int calls = 0;
  mm::match m {mm::integer(1)};
  m.on(pat::equal(mm::integer(1)), [&] (mm::value) { calls++; return 1; })
   .on(pat::equal(mm::integer(1)), [&] (mm::value) { calls++; return 2; })
   .otherwise([&] { calls++; return 3; });

  EXPECT_TRUE(m.matched());
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(mm::equal(m.result(), mm::integer(1)));
}

TEST_F(MatchTest, Otherwise)
{
  const mm::value x = mm::match {mm::str("x")}
    .on(pat::of_type(mm::types::number), [] (mm::value) { return "number"; })
    .otherwise([] { return "other"; })
    .result();
  EXPECT_TRUE(mm::equal(x, mm::str("other")));
}

// Bodies returning nothing produce nil
TEST_F(MatchTest, VoidBody)
{
  bool ran = false;
  const mm::value x = mm::match {mm::integer(1)}
    .on(pat::ignore(), [&] (mm::value) { ran = true; })
    .result();
  EXPECT_TRUE(ran);
  EXPECT_TRUE(mm::isnil(x));
}

// A failed nested match lets the outer one continue
TEST_F(MatchTest, Subcases)
{
  auto classify = [] (mm::value x) {
    return mm::match {x}
      .subcases([] (mm::match &m) {
        m.on(pat::all(pat::of_type(mm::types::integer),
                      pat::in(mm::list(1, 2, 3))),
             [] (mm::value) { return "small"; });
      })
      .on(pat::of_type(mm::types::integer), [] (mm::value) { return "integer"; })
      .otherwise([] { return "other"; })
      .result();
  };

  EXPECT_TRUE(mm::equal(classify(mm::integer(2)), mm::str("small")));
  EXPECT_TRUE(mm::equal(classify(mm::integer(7)), mm::str("integer")));
  EXPECT_TRUE(mm::equal(classify(mm::str("7")), mm::str("other")));
}

// A body raising match_error counts as a failed case
TEST_F(MatchTest, FailingBody)
{
  const mm::value x = mm::match {mm::integer(4)}
    .on(pat::ignore(), [] (mm::value y) {
      return mm::getmatch(y, pat::equal(mm::integer(5)));
    })
    .otherwise([] { return 0; })
    .result();
  EXPECT_TRUE(mm::equal(x, mm::integer(0)));
}

// A case whose pattern reads a key the subject lacks is skipped
TEST_F(MatchTest, LookupErrorInPattern)
{
  class named: public mm::pattern {
    public:
    mm::match_result
    match(mm::value x) const override
    { return mm::table_ref(x, mm::str("name")); }

    void
    display(std::ostream &os) const override
    { os << "named"; }
  };

  const mm::value got = mm::match {mm::integer(4)}
    .on(mm::make<named>(), [] (mm::value) { return 1; })
    .on(pat::of_type(mm::types::integer), [] (mm::value) { return 2; })
    .result();
  EXPECT_TRUE(mm::equal(got, mm::integer(2)));
}
