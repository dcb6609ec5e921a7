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


#include "multimethod/registry.hpp"
#include "multimethod/types.hpp"

#include <gc.h>
#include <gtest/gtest.h>
#include <tuple>


class RegistryTest: public testing::Test {
  protected:
  // The fixture lives outside of the collected heap
  void
  SetUp() override
  { GC_add_roots(this, this + 1); }

  void
  TearDown() override
  { GC_remove_roots(this, this + 1); }

  // Method returning a constant
  static mm::method
  returning(long long x)
  { return [x] (const mm::arguments &) { return mm::integer(x); }; }

  static long long
  call(const mm::method *m)
  { return mm::int_val((*m)(mm::arguments {})); }

  mm::registry registry;
};

TEST_F(RegistryTest, InsertionOrder)
{
  EXPECT_TRUE(registry.insert(mm::specs(1), {}, returning(1)));
  EXPECT_TRUE(registry.insert(mm::specs(2), {}, returning(2)));
  EXPECT_TRUE(registry.insert(mm::specs(3), {}, returning(3)));

  const mm::registry::snapshot *snap = registry.current();
  ASSERT_EQ(snap->entries.size(), 3u);
  EXPECT_TRUE(mm::equal(snap->entries[0].specs[0], mm::integer(1)));
  EXPECT_TRUE(mm::equal(snap->entries[1].specs[0], mm::integer(2)));
  EXPECT_TRUE(mm::equal(snap->entries[2].specs[0], mm::integer(3)));
}

// Re-registering a key swaps the implementation in place
TEST_F(RegistryTest, Replace)
{
  std::ignore = registry.insert(mm::specs(1), {}, returning(1));
  std::ignore = registry.insert(mm::specs(2), {}, returning(2));
  EXPECT_FALSE(registry.insert(mm::specs(1), {}, returning(10)));

  const mm::registry::snapshot *snap = registry.current();
  ASSERT_EQ(snap->entries.size(), 2u);
  EXPECT_EQ(call(snap->entries[0].impl), 10);
  EXPECT_EQ(call(snap->entries[1].impl), 2);
  EXPECT_EQ(registry.size(), 2u);
}

// Spec tokens sharing structure name the same key as fresh copies of them
TEST_F(RegistryTest, ReplaceWithSharedTokens)
{
  mm::value l = mm::list(1, 2);
  std::ignore = registry.insert(mm::specs(l, l), {}, returning(1));
  EXPECT_FALSE(registry.insert(mm::specs(mm::list(1, 2), mm::list(1, 2)), {},
                               returning(2)));

  const mm::registry::snapshot *snap = registry.current();
  ASSERT_EQ(snap->entries.size(), 1u);
  EXPECT_EQ(call(snap->entries[0].impl), 2);
}

TEST_F(RegistryTest, Lookup)
{
  std::ignore = registry.insert(mm::specs(mm::types::integer, "x"), {}, returning(1));
  std::ignore = registry.insert(mm::specs(mm::types::integer),
                                {{"scale", mm::from(mm::types::real)}},
                                returning(2));

  const mm::method *m = registry.lookup(mm::specs(mm::types::integer, "x"));
  ASSERT_NE(m, nullptr);
  EXPECT_EQ(call(m), 1);

  m = registry.lookup(mm::specs(mm::types::integer),
                      {{"scale", mm::from(mm::types::real)}});
  ASSERT_NE(m, nullptr);
  EXPECT_EQ(call(m), 2);

  EXPECT_EQ(registry.lookup(mm::specs(mm::types::integer)), nullptr);
  EXPECT_EQ(registry.lookup(mm::specs(mm::types::real, "x")), nullptr);
}

// Keyword specs are part of the key regardless of how they were written
TEST_F(RegistryTest, DispatchKey)
{
  const mm::value key =
      mm::dispatch_key(mm::specs(1, 2), {{"b", mm::integer(4)},
                                         {"a", mm::integer(3)}});
  EXPECT_TRUE(mm::equal(key,
      mm::list(mm::list(1, 2),
               mm::cons(mm::sym("a"), mm::integer(3)),
               mm::cons(mm::sym("b"), mm::integer(4)))));

  EXPECT_FALSE(mm::equal(mm::dispatch_key(mm::specs(1), {}),
                         mm::dispatch_key(mm::specs(1.0), {})));
}

// A snapshot taken before a registration does not see it
TEST_F(RegistryTest, Snapshots)
{
  std::ignore = registry.insert(mm::specs(1), {}, returning(1));
  const mm::registry::snapshot *before = registry.current();

  std::ignore = registry.insert(mm::specs(2), {}, returning(2));
  std::ignore = registry.insert(mm::specs(1), {}, returning(10));

  EXPECT_EQ(before->entries.size(), 1u);
  EXPECT_EQ(call(before->entries[0].impl), 1);
  EXPECT_EQ(registry.current()->entries.size(), 2u);
  EXPECT_NE(before, registry.current());
}
