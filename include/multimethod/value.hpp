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

#include "multimethod/memory.hpp"

#include <cassert>
#include <concepts>
#include <cstring>
#include <initializer_list>
#include <limits>
#include <ostream>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

/**
 * \file value.hpp
 * Dynamic values that generic functions are called with
 *
 * A value is a reference to a tagged object allocated in the collected heap.
 * Values are cheap to copy and compare by structure with equal().
 *
 * \ingroup core
 */


namespace mm {


/**
 * Tag enumeration for object types
 *
 * \ingroup core
 */
enum class tag {
  nil,
  boolean,
  integer,
  real,
  str,
  sym,
  pair,
  table,
  record,
  type,
  pattern,
  ptr,
};

struct object;
struct type;
class pattern;
struct table_data;
struct record_data;


/**
 * Reference to an object
 *
 * \ingroup core
 */
class value {
  public:
  explicit constexpr value(object *ptr) noexcept
  : m_ptr {ptr}
  { assert(ptr != nullptr); }

  /** Default-constructed value is nil */
  value();

  constexpr object*
  operator -> () const noexcept
  { return m_ptr; }

  constexpr object&
  operator * () const noexcept
  { return *m_ptr; }

  /**
   * Structural equality
   *
   * \see equal()
   */
  [[nodiscard]] bool
  operator == (value other) const;

  private:
  object *m_ptr; /**< Pointer to the object */
}; // class mm::value


/**
 * Object structure behind a value
 *
 * \ingroup core
 */
struct object {
  constexpr object(enum tag tag) noexcept
  : t {tag}, ptr {nullptr}
  { }

  constexpr object(bool b) noexcept
  : t {tag::boolean}, boolean {b}
  { }

  enum tag t; /**< Type tag */
  union {
    bool boolean;
    long long integer;
    double real;
    struct { char *data; size_t len; } str;
    struct { const char *data; size_t len; } sym; /**< Interned name */
    struct { object *car, *cdr; };
    table_data *table;
    record_data *record;
    const struct type *type;
    const class pattern *pattern;
    void *ptr;
  };
}; // struct mm::object


/**
 * Ordered key/value mapping behind table values
 *
 * \ingroup core
 */
struct table_data {
  stl::vector<std::pair<value, value>> entries;
}; // struct mm::table_data


extern const value True, False; /**< Boolean constants */
extern const value nil; /**< Nil constant, also the empty list */


/**
 * Get the tag of a value
 *
 * \ingroup core
 */
[[nodiscard]] inline enum tag
tag(value x) noexcept
{ return x->t; }


/**
 * \name Fundamental constructors
 * \{
 */

/**
 * Create (or find) an interned symbol
 *
 * Symbols with the same name share their name storage, so symbol equality is
 * a pointer comparison.
 *
 * \ingroup core
 */
[[nodiscard]] value
sym(std::string_view name);

/**
 * Create a string value
 *
 * \ingroup core
 */
[[nodiscard]] inline value
str(std::string_view s)
{
  value ret {make<object>(tag::str)};
  ret->str.data = static_cast<char*>(allocate_atomic(s.length() + 1));
  std::memcpy(ret->str.data, s.data(), s.length());
  ret->str.data[s.length()] = '\0';
  ret->str.len = s.length();
  return ret;
}

[[nodiscard]] inline value
integer(long long x)
{
  value ret {make_atomic<object>(tag::integer)};
  ret->integer = x;
  return ret;
}

[[nodiscard]] inline value
real(double x)
{
  value ret {make_atomic<object>(tag::real)};
  ret->real = x;
  return ret;
}

[[nodiscard]] inline value
boolean(bool x) noexcept
{ return x ? True : False; }

[[nodiscard]] inline value
ptr(void *p)
{
  value ret {make<object>(tag::ptr)};
  ret->ptr = p;
  return ret;
}

/**
 * Create a pair (cons cell)
 *
 * \param car First element
 * \param cdr Second element
 * \return Pair value
 *
 * \ingroup core
 */
[[nodiscard]] inline value
cons(value car, value cdr)
{
  value ret {make<object>(tag::pair)};
  ret->car = &*car;
  ret->cdr = &*cdr;
  return ret;
}

/** \} */


/**
 * \name Conversions from C++ types
 * \{
 */

[[nodiscard]] inline value
from(value x) noexcept
{ return x; }

[[nodiscard]] inline value
from(bool x) noexcept
{ return boolean(x); }

/**
 * \throws std::out_of_range If `x` does not fit into `long long`
 */
template <std::integral T>
requires (not std::same_as<T, bool>)
[[nodiscard]] value
from(T x)
{
  if constexpr (std::is_unsigned_v<T> and sizeof(T) >= sizeof(long long))
  {
    if (x > static_cast<T>(std::numeric_limits<long long>::max()))
      throw std::out_of_range {"from() - integer does not fit into long long"};
  }
  return integer(static_cast<long long>(x));
}

template <std::floating_point T>
[[nodiscard]] value
from(T x)
{ return real(static_cast<double>(x)); }

[[nodiscard]] inline value
from(const char *s)
{ return str(s); }

[[nodiscard]] inline value
from(std::string_view s)
{ return str(s); }

[[nodiscard]] inline value
from(const std::string &s)
{ return str(s); }

/**
 * Wrap a runtime type descriptor, e.g. to use it as a spec token
 *
 * \ingroup core
 */
[[nodiscard]] value
from(const type &t);

/**
 * Wrap a pattern, e.g. to use it as a spec token
 *
 * \ingroup core
 */
[[nodiscard]] value
from(const pattern *p);

/** \} */


/**
 * \name Lists
 * \{
 */

[[nodiscard]] inline value
list()
{ return nil; }

/**
 * Create a proper list; every element goes through from()
 *
 * \ingroup core
 */
template <typename Head, typename ...Tail>
[[nodiscard]] value
list(Head &&head, Tail&& ...tail)
{ return cons(from(std::forward<Head>(head)), list(std::forward<Tail>(tail)...)); }

/**
 * Create a list from a range of values
 *
 * \ingroup core
 */
template <std::ranges::range Range>
[[nodiscard]] value
list_of(const Range &range)
{
  value acc = nil;
  for (const value x : range | std::views::reverse)
    acc = cons(x, acc);
  return acc;
}

/** \} */


/**
 * \name Type tests
 * \{
 */

[[nodiscard]] inline bool
isnil(value x) noexcept
{ return x->t == tag::nil; }

[[nodiscard]] inline bool
isbool(value x) noexcept
{ return x->t == tag::boolean; }

[[nodiscard]] inline bool
isint(value x) noexcept
{ return x->t == tag::integer; }

[[nodiscard]] inline bool
isreal(value x) noexcept
{ return x->t == tag::real; }

/** Integer or real */
[[nodiscard]] inline bool
isnum(value x) noexcept
{ return isint(x) or isreal(x); }

[[nodiscard]] inline bool
isstr(value x) noexcept
{ return x->t == tag::str; }

[[nodiscard]] inline bool
issym(value x) noexcept
{ return x->t == tag::sym; }

[[nodiscard]] inline bool
issym(value x, std::string_view name) noexcept
{ return issym(x) and name == std::string_view {x->sym.data, x->sym.len}; }

[[nodiscard]] inline bool
ispair(value x) noexcept
{ return x->t == tag::pair; }

[[nodiscard]] inline bool
istable(value x) noexcept
{ return x->t == tag::table; }

[[nodiscard]] inline bool
isrecord(value x) noexcept
{ return x->t == tag::record; }

[[nodiscard]] inline bool
istype(value x) noexcept
{ return x->t == tag::type; }

[[nodiscard]] inline bool
ispattern(value x) noexcept
{ return x->t == tag::pattern; }

[[nodiscard]] inline bool
isptr(value x) noexcept
{ return x->t == tag::ptr; }

/** \} */


/**
 * \name Accessors
 *
 * All of them throw std::invalid_argument when the value has another shape.
 * \{
 */

[[nodiscard]] inline bool
bool_val(value x)
{
  if (not isbool(x))
    throw std::invalid_argument {"bool_val() - not a boolean"};
  return x->boolean;
}

[[nodiscard]] inline long long
int_val(value x)
{
  if (not isint(x))
    throw std::invalid_argument {"int_val() - not an integer"};
  return x->integer;
}

[[nodiscard]] inline double
real_val(value x)
{
  if (not isreal(x))
    throw std::invalid_argument {"real_val() - not a real"};
  return x->real;
}

/**
 * Numeric value of an integer or a real
 *
 * \throws std::invalid_argument If the value is not a number
 *
 * \ingroup core
 */
[[nodiscard]] inline double
num_val(value x)
{
  if (isint(x))
    return static_cast<double>(x->integer);
  if (isreal(x))
    return x->real;
  throw std::invalid_argument {"num_val() - not a number"};
}

[[nodiscard]] inline std::string_view
str_view(value x)
{
  if (not isstr(x))
    throw std::invalid_argument {"str_view() - not a string"};
  return std::string_view {x->str.data, x->str.len};
}

[[nodiscard]] inline std::string_view
sym_name(value x)
{
  if (not issym(x))
    throw std::invalid_argument {"sym_name() - not a symbol"};
  return std::string_view {x->sym.data, x->sym.len};
}

[[nodiscard]] const type&
type_val(value x);

[[nodiscard]] const pattern*
pattern_val(value x);

[[nodiscard]] inline void*
ptr_val(value x)
{
  if (not isptr(x))
    throw std::invalid_argument {"ptr_val() - not a pointer"};
  return x->ptr;
}

/** \} */


/**
 * \name Basic functions
 * \{
 */

/**
 * Check if two values are the same object
 *
 * \ingroup core
 */
[[nodiscard]] inline bool
is(value a, value b) noexcept
{ return &*a == &*b; }

/**
 * Check if two values are structurally equal
 *
 * Numbers are equal only when both tag and value agree, so `1` and `1.0`
 * differ. Types, patterns and pointers compare by identity.
 *
 * \ingroup core
 */
[[nodiscard]] bool
equal(value a, value b);

/** \} */


/**
 * \name Lists
 * \{
 */

template <bool Test=true>
[[nodiscard]] inline value
car(value x)
{
  if constexpr (Test)
  {
    if (x->t != tag::pair)
      throw std::invalid_argument {"car() - not a pair"};
  }
  return value {x->car};
}

template <bool Test=true>
[[nodiscard]] inline value
cdr(value x)
{
  if constexpr (Test)
  {
    if (x->t != tag::pair)
      throw std::invalid_argument {"cdr() - not a pair"};
  }
  return value {x->cdr};
}

[[nodiscard]] inline size_t
length(value l) noexcept
{
  size_t len = 0;
  for (; l->t == tag::pair; l = cdr<false>(l), ++len);
  return len;
}

/**
 * Check if a value is a member of a list (using value equality)
 *
 * \ingroup core
 */
[[nodiscard]] inline bool
member(value x, value l)
{
  for (; l->t == tag::pair; l = cdr<false>(l))
  {
    if (equal(x, car<false>(l)))
      return true;
  }
  return false;
}

/**
 * Check if a value is a member of a list (using identity)
 *
 * \ingroup core
 */
[[nodiscard]] inline bool
memq(value x, value l) noexcept
{
  for (; l->t == tag::pair; l = cdr<false>(l))
  {
    if (is(x, car<false>(l)))
      return true;
  }
  return false;
}

/**
 * Get the k-th element of a list
 *
 * \param l List
 * \param k Index of the element
 * \param[out] result Set to the element when it exists
 * \return False if `l` is shorter than `k + 1` elements
 *
 * \ingroup core
 */
[[nodiscard]] inline bool
list_find(value l, size_t k, value &result) noexcept
{
  for (; l->t == tag::pair; l = cdr<false>(l), --k)
  {
    if (k == 0)
    {
      result = car<false>(l);
      return true;
    }
  }
  return false;
}

/**
 * Get the k-th element of a list
 *
 * \throws lookup_error If the list is too short
 *
 * \ingroup core
 */
[[nodiscard]] value
list_ref(value l, size_t k);

/** \} */


/**
 * \name Tables
 * \{
 */

/**
 * Create a table
 *
 * Later entries replace earlier ones with an equal key; the position of the
 * first occurrence is kept.
 *
 * \ingroup core
 */
[[nodiscard]] value
table(std::initializer_list<std::pair<value, value>> entries);

[[nodiscard]] inline const table_data&
table_val(value x)
{
  if (not istable(x))
    throw std::invalid_argument {"table_val() - not a table"};
  return *x->table;
}

/**
 * Look up a key in a table
 *
 * \param t Table (any other value simply has no keys)
 * \param k Key to look up
 * \param[out] result Set to the associated value when found
 * \return True if the key was found
 *
 * \ingroup core
 */
[[nodiscard]] bool
table_find(value t, value k, value &result);

/**
 * Look up a key in a table
 *
 * \throws lookup_error If `t` is not a table or has no such key
 *
 * \ingroup core
 */
[[nodiscard]] value
table_ref(value t, value k);

/** \} */


/**
 * \name Printing
 * \{
 */

/**
 * Write value in a format that can be parsed back preserving the value
 *
 * \ingroup core
 */
void
write(std::ostream &os, value val);

/**
 * Write value in a human appealing format (strings without quotes)
 *
 * \ingroup core
 */
void
display(std::ostream &os, value val);

inline std::ostream&
operator << (std::ostream &os, value val)
{ write(os, val); return os; }

/** \} */

} // namespace mm


inline
mm::value::value()
: m_ptr {&*mm::nil}
{ }

inline bool
mm::value::operator == (mm::value other) const
{ return mm::equal(*this, other); }
