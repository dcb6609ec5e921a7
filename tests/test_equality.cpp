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


#include "multimethod/exceptions.hpp"
#include "multimethod/format.hpp"
#include "multimethod/hash.hpp"
#include "multimethod/types.hpp"
#include "multimethod/value.hpp"

#include <gtest/gtest.h>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>

namespace {

// Test fixture for equality tests
class EqualityTest: public ::testing::Test {
  protected:
  static std::string
  written(mm::value x)
  {
    std::ostringstream buf;
    mm::write(buf, x);
    return buf.str();
  }
};

// Test equality of identical objects (is)
TEST_F(EqualityTest, IdenticalObjects)
{
  mm::value val = mm::sym("test");

  // Same object should be equal
  EXPECT_TRUE(mm::is(val, val));
  EXPECT_TRUE(mm::equal(val, val));
}

// Test equality of symbols
TEST_F(EqualityTest, Symbols)
{
  mm::value sym1 = mm::sym("test");
  mm::value sym2 = mm::sym("test");
  mm::value sym3 = mm::sym("different");

  // Different objects with same symbol name should be equal
  EXPECT_FALSE(mm::is(sym1, sym2));
  EXPECT_TRUE(mm::equal(sym1, sym2));

  // Different symbol names should not be equal
  EXPECT_FALSE(mm::equal(sym1, sym3));
}

// Test equality of nil
TEST_F(EqualityTest, Nil)
{
  EXPECT_TRUE(mm::equal(mm::nil, mm::nil));
  EXPECT_TRUE(mm::isnil(mm::value {}));
  EXPECT_FALSE(mm::equal(mm::nil, mm::sym("nil")));
  EXPECT_FALSE(mm::equal(mm::nil, mm::False));
}

// Integers and reals are distinct even when numerically equal
TEST_F(EqualityTest, Numbers)
{
  EXPECT_TRUE(mm::equal(mm::integer(42), mm::integer(42)));
  EXPECT_FALSE(mm::equal(mm::integer(42), mm::integer(43)));
  EXPECT_TRUE(mm::equal(mm::real(1.5), mm::real(1.5)));
  EXPECT_FALSE(mm::equal(mm::integer(1), mm::real(1.0)));
  EXPECT_EQ(mm::num_val(mm::integer(1)), mm::num_val(mm::real(1.0)));

  EXPECT_TRUE(mm::equal(mm::from(42ull), mm::integer(42)));
  EXPECT_THROW(std::ignore = mm::from(std::numeric_limits<unsigned long long>::max()),
               std::out_of_range);
}

TEST_F(EqualityTest, Strings)
{
  EXPECT_TRUE(mm::equal(mm::str("hello"), mm::str("hello")));
  EXPECT_FALSE(mm::equal(mm::str("hello"), mm::str("world")));
  EXPECT_FALSE(mm::equal(mm::str("hello"), mm::sym("hello")));
}

TEST_F(EqualityTest, Booleans)
{
  EXPECT_TRUE(mm::equal(mm::True, mm::boolean(true)));
  EXPECT_TRUE(mm::equal(mm::False, mm::from(false)));
  EXPECT_FALSE(mm::equal(mm::True, mm::False));
  EXPECT_TRUE(mm::bool_val(mm::True));
}

// Test equality of lists
TEST_F(EqualityTest, Lists)
{
  mm::value list1 = mm::list(1, "two", mm::sym("three"));
  mm::value list2 = mm::list(1, "two", mm::sym("three"));
  mm::value list3 = mm::list(1, "two");

  EXPECT_TRUE(mm::equal(list1, list2));
  EXPECT_FALSE(mm::equal(list1, list3));
  EXPECT_EQ(mm::length(list1), 3u);

  // Nested lists
  EXPECT_TRUE(mm::equal(mm::list(mm::list(1, 2), 3), mm::list(mm::list(1, 2), 3)));
  EXPECT_FALSE(mm::equal(mm::list(mm::list(1, 2), 3), mm::list(mm::list(1, 3), 3)));
}

// Self-referencing structures must not hang the comparison
TEST_F(EqualityTest, CyclicLists)
{
  mm::value a = mm::list(1, 2);
  mm::value b = mm::list(1, 2);
  mm::cdr(a)->cdr = &*a;
  mm::cdr(b)->cdr = &*b;
  EXPECT_TRUE(mm::equal(a, b));
  EXPECT_EQ(mm::hash(a), mm::hash(b));
}

// Tables compare as mappings, regardless of the order of entries
TEST_F(EqualityTest, Tables)
{
  mm::value t1 = mm::table({{mm::str("a"), mm::integer(1)},
                            {mm::str("b"), mm::integer(2)}});
  mm::value t2 = mm::table({{mm::str("b"), mm::integer(2)},
                            {mm::str("a"), mm::integer(1)}});
  mm::value t3 = mm::table({{mm::str("a"), mm::integer(1)}});

  EXPECT_TRUE(mm::equal(t1, t2));
  EXPECT_FALSE(mm::equal(t1, t3));
  EXPECT_EQ(mm::hash(t1), mm::hash(t2));
}

TEST_F(EqualityTest, TableDuplicateKeys)
{
  mm::value t = mm::table({{mm::str("a"), mm::integer(1)},
                           {mm::str("b"), mm::integer(2)},
                           {mm::str("a"), mm::integer(3)}});
  EXPECT_EQ(mm::table_val(t).entries.size(), 2u);
  EXPECT_TRUE(mm::equal(mm::table_ref(t, mm::str("a")), mm::integer(3)));
  EXPECT_TRUE(mm::equal(mm::table_val(t).entries.front().first, mm::str("a")));
}

TEST_F(EqualityTest, Lookups)
{
  mm::value t = mm::table({{mm::str("a"), mm::integer(1)}});
  EXPECT_THROW(std::ignore = mm::table_ref(t, mm::str("b")), mm::lookup_error);
  EXPECT_THROW(std::ignore = mm::table_ref(mm::nil, mm::str("a")),
               mm::lookup_error);
  EXPECT_THROW(std::ignore = mm::list_ref(mm::list(1, 2), 2), mm::lookup_error);
  EXPECT_THROW(std::ignore = mm::list_ref(mm::integer(7), 0), mm::lookup_error);
  EXPECT_TRUE(mm::equal(mm::list_ref(mm::list(1, 2), 1), mm::integer(2)));
  EXPECT_THROW(std::ignore = mm::int_val(mm::str("1")), std::invalid_argument);
}

// Types, patterns and pointers compare by identity
TEST_F(EqualityTest, Descriptors)
{
  EXPECT_TRUE(mm::equal(mm::from(mm::types::integer), mm::from(mm::types::integer)));
  EXPECT_FALSE(mm::equal(mm::from(mm::types::integer), mm::from(mm::types::real)));

  int x = 0, y = 0;
  EXPECT_TRUE(mm::equal(mm::ptr(&x), mm::ptr(&x)));
  EXPECT_FALSE(mm::equal(mm::ptr(&x), mm::ptr(&y)));
}

TEST_F(EqualityTest, HashConsistency)
{
  EXPECT_EQ(mm::hash(mm::list(1, "a", 2.5)), mm::hash(mm::list(1, "a", 2.5)));
  EXPECT_EQ(mm::hash(mm::str("abc")), mm::hash(mm::str("abc")));
  EXPECT_EQ(mm::hash(mm::sym("abc")), mm::hash(mm::sym("abc")));

  mm::stl::unordered_map<mm::value, int> map;
  map[mm::list(1, 2)] = 1;
  EXPECT_EQ(map.count(mm::list(1, 2)), 1u);
  EXPECT_EQ(map.count(mm::list(2, 1)), 0u);
}

// A node reached twice through shared structure hashes like two copies of it
TEST_F(EqualityTest, HashSharedStructure)
{
  mm::value l = mm::list(1, 2);
  mm::value shared = mm::list(l, l);
  mm::value copied = mm::list(mm::list(1, 2), mm::list(1, 2));
  ASSERT_TRUE(mm::equal(shared, copied));
  EXPECT_EQ(mm::hash(shared), mm::hash(copied));

  mm::value t = mm::table({{mm::str("k"), mm::integer(1)}});
  mm::value shared_tables = mm::table({{mm::str("a"), t}, {mm::str("b"), t}});
  mm::value copied_tables =
      mm::table({{mm::str("a"), mm::table({{mm::str("k"), mm::integer(1)}})},
                 {mm::str("b"), mm::table({{mm::str("k"), mm::integer(1)}})}});
  ASSERT_TRUE(mm::equal(shared_tables, copied_tables));
  EXPECT_EQ(mm::hash(shared_tables), mm::hash(copied_tables));
}

TEST_F(EqualityTest, Printing)
{
  EXPECT_EQ(written(mm::list(1, "two", mm::sym("three"), 4.5)),
            "(1 \"two\" three 4.5)");
  EXPECT_EQ(written(mm::real(1.0)), "1.0");
  EXPECT_EQ(written(mm::cons(mm::integer(1), mm::integer(2))), "(1 . 2)");
  EXPECT_EQ(written(mm::nil), "()");
  EXPECT_EQ(written(mm::True), "#t");
  EXPECT_EQ(written(mm::from(mm::types::integer)), "#<type integer>");
  EXPECT_EQ(written(mm::table({{mm::str("type"), mm::str("circle")}})),
            "{\"type\": \"circle\"}");
  EXPECT_EQ(std::format("{:d}", mm::str("plain")), "plain");
  EXPECT_EQ(std::format("{}", mm::str("quoted")), "\"quoted\"");
}

} // anonymous namespace
