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


#include "multimethod/extractors.hpp"
#include "multimethod/types.hpp"

#include <gtest/gtest.h>

namespace pat = mm::pat;


class ExtractorsTest: public testing::Test {
  protected:
  void
  SetUp() override
  {
    circle = &mm::make_record_type("circle", {"r", "color"});
  }

  const mm::type *circle;
};

// Subscript access on tables, lists and strings
TEST_F(ExtractorsTest, Key)
{
  mm::value t = mm::table({{mm::str("a"), mm::integer(1)},
                           {mm::integer(0), mm::str("zero")}});
  EXPECT_TRUE(mm::equal(*mm::attempt(pat::key(mm::str("a")), t), mm::integer(1)));
  EXPECT_TRUE(mm::equal(*mm::attempt(pat::key(mm::integer(0)), t), mm::str("zero")));
  EXPECT_FALSE(mm::ismatch(t, pat::key(mm::str("b"))));

  mm::value l = mm::list(10, 20, 30);
  EXPECT_TRUE(mm::equal(*mm::attempt(pat::key(mm::integer(1)), l), mm::integer(20)));
  EXPECT_TRUE(mm::equal(*mm::attempt(pat::key(mm::integer(-1)), l), mm::integer(30)));
  EXPECT_FALSE(mm::ismatch(l, pat::key(mm::integer(3))));
  EXPECT_FALSE(mm::ismatch(l, pat::key(mm::str("a"))));

  mm::value s = mm::str("abc");
  EXPECT_TRUE(mm::equal(*mm::attempt(pat::key(mm::integer(2)), s), mm::str("c")));
  EXPECT_FALSE(mm::ismatch(s, pat::key(mm::integer(3))));
}

// Values that can not be subscripted simply fail
TEST_F(ExtractorsTest, KeyWrongShape)
{
  EXPECT_FALSE(mm::ismatch(mm::integer(5), pat::key(mm::str("a"))));
  EXPECT_FALSE(mm::ismatch(mm::sym("a"), pat::key(mm::integer(0))));
  EXPECT_FALSE(mm::ismatch(mm::nil, pat::key(mm::integer(0))));
}

TEST_F(ExtractorsTest, Keys)
{
  mm::value t = mm::table({{mm::str("x"), mm::integer(1)},
                           {mm::str("y"), mm::integer(2)}});

  const mm::match_result m = mm::attempt(pat::keys("y", "x"), t);
  ASSERT_TRUE(m.has_value());
  EXPECT_TRUE(mm::equal(*m, mm::list(2, 1)));

  EXPECT_FALSE(mm::ismatch(t, pat::keys("x", "z")));
  EXPECT_TRUE(mm::equal(*mm::attempt(pat::keys(), t), mm::nil));
}

TEST_F(ExtractorsTest, Attr)
{
  mm::value c = mm::make_record(*circle, {mm::integer(2), mm::str("red")});

  EXPECT_TRUE(mm::equal(*mm::attempt(pat::attr("r"), c), mm::integer(2)));
  EXPECT_FALSE(mm::ismatch(c, pat::attr("w")));
  EXPECT_FALSE(mm::ismatch(mm::table({{mm::str("r"), mm::integer(2)}}),
                           pat::attr("r")));
  EXPECT_FALSE(mm::ismatch(mm::integer(2), pat::attr("r")));
}

TEST_F(ExtractorsTest, Attrs)
{
  mm::value c = mm::make_record(*circle, {mm::integer(2), mm::str("red")});

  const mm::match_result m = mm::attempt(pat::attrs("color", "r"), c);
  ASSERT_TRUE(m.has_value());
  EXPECT_TRUE(mm::equal(*m, mm::list("red", 2)));

  EXPECT_FALSE(mm::ismatch(c, pat::attrs("r", "h")));
}

TEST_F(ExtractorsTest, Display)
{
  EXPECT_EQ(pat::key(mm::str("type"))->display(), "key(\"type\")");
  EXPECT_EQ(pat::attr("r")->display(), "attr(r)");
}
