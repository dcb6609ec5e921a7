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


#include "multimethod/predicate.hpp"

#include <utility>


namespace {

class callable_predicate: public mm::predicate {
  public:
  callable_predicate(std::string_view name, std::function<bool(mm::value)> fn)
  : m_name {name}, m_fn {std::move(fn)}
  { }

  bool
  test(mm::value x) const override
  {
    try { return m_fn(x); }
    catch (const mm::lookup_error &) { return false; }
  }

  void
  display(std::ostream &os) const override
  { os << m_name; }

  private:
  mm::stl::string m_name;
  std::function<bool(mm::value)> m_fn;
}; // class callable_predicate


class equal_predicate: public mm::predicate {
  public:
  explicit equal_predicate(mm::value v): m_value {v} { }

  bool
  test(mm::value x) const override
  { return mm::equal(x, m_value); }

  void
  display(std::ostream &os) const override
  { os << "equal(" << m_value << ')'; }

  private:
  mm::value m_value;
}; // class equal_predicate


class is_predicate: public mm::predicate {
  public:
  explicit is_predicate(mm::value v): m_value {v} { }

  bool
  test(mm::value x) const override
  { return mm::is(x, m_value); }

  void
  display(std::ostream &os) const override
  { os << "is(" << m_value << ')'; }

  private:
  mm::value m_value;
}; // class is_predicate


class in_predicate: public mm::predicate {
  public:
  explicit in_predicate(mm::value container): m_container {container} { }

  bool
  test(mm::value x) const override
  {
    using namespace mm;
    switch (tag(m_container))
    {
      case tag::nil:
      case tag::pair:
        return member(x, m_container);

      case tag::table: {
        value dummy;
        return table_find(m_container, x, dummy);
      }

      case tag::str:
        return isstr(x) and
               str_view(m_container).find(str_view(x)) != std::string_view::npos;

      default:
        return false;
    }
  }

  void
  display(std::ostream &os) const override
  { os << "in(" << m_container << ')'; }

  private:
  mm::value m_container;
}; // class in_predicate


class type_predicate: public mm::predicate {
  public:
  explicit type_predicate(const mm::type &t): m_type {t} { }

  bool
  test(mm::value x) const override
  { return mm::isinstance(x, m_type); }

  void
  display(std::ostream &os) const override
  { os << "of_type(" << m_type.name << ')'; }

  private:
  const mm::type &m_type;
}; // class type_predicate

} // anonymous namespace


const mm::predicate*
mm::detail::function_predicate(std::string_view name,
                               std::function<bool(value)> fn)
{ return make<callable_predicate>(name, std::move(fn)); }

const mm::predicate*
mm::pat::equal(value v)
{ return make<equal_predicate>(v); }

const mm::predicate*
mm::pat::is(value v)
{ return make<is_predicate>(v); }

const mm::predicate*
mm::pat::in(value container)
{ return make<in_predicate>(container); }

const mm::predicate*
mm::pat::of_type(const type &t)
{ return make<type_predicate>(t); }
