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


#include "multimethod/value.hpp"
#include "multimethod/pattern.hpp"
#include "multimethod/types.hpp"

#include <format>
#include <string>


enum class mode {
  write,
  display,
};


static void
_print_string(mode mode, std::ostream &os, std::string_view s)
{
  if (mode == mode::display)
  {
    os << s;
    return;
  }

  os << '"';
  for (const char c : s)
  {
    switch (c)
    {
      case '"':
      case '\\':
        os.put('\\');
        os.put(c);
        break;

      case '\a':
      case '\b':
      case '\f':
      case '\n':
      case '\r':
      case '\t':
      case '\v':
      case '\e':
        os << std::format("\\x{:02x}", int(c));
        break;

      default:
        os.put(c);
    }
  }
  os << '"';
}


static void
_print_real(std::ostream &os, double x)
{
  std::string buf = std::format("{}", x);
  // Keep reals distinguishable from integers
  if (buf.find_first_of(".eni") == std::string::npos)
    buf += ".0";
  os << buf;
}


static void
_print(mode mode, std::ostream &os, mm::value val, mm::value mem)
{
  using namespace mm;

  switch (mm::tag(val))
  {
    case tag::nil:
      os << "()";
      break;

    case tag::boolean:
      os << (val->boolean ? "#t" : "#f");
      break;

    case tag::integer:
      os << val->integer;
      break;

    case tag::real:
      _print_real(os, val->real);
      break;

    case tag::sym:
      os << sym_name(val);
      break;

    case tag::str:
      _print_string(mode, os, str_view(val));
      break;

    case tag::ptr:
      os << "#<ptr " << ptr_val(val) << '>';
      break;

    case tag::type:
      os << "#<type " << val->type->name << '>';
      break;

    case tag::pattern:
      os << "#<pattern ";
      val->pattern->display(os);
      os << '>';
      break;

    case tag::table: {
      if (memq(val, mem))
      {
        os << "{...}";
        return;
      }
      mem = cons(val, mem);

      os << '{';
      bool first = true;
      for (const auto &[key, x] : val->table->entries)
      {
        if (not first)
          os << ", ";
        first = false;
        _print(mode, os, key, mem);
        os << ": ";
        _print(mode, os, x, mem);
      }
      os << '}';
      break;
    }

    case tag::record: {
      const record_data &data = *val->record;
      if (memq(val, mem))
      {
        os << "#<" << data.rtype->name << " ...>";
        return;
      }
      mem = cons(val, mem);

      os << "#<" << data.rtype->name;
      const auto &names = data.rtype->layout->fields;
      for (size_t i = 0; i < data.fields.size(); ++i)
      {
        os << ' ' << sym_name(names[i]) << '=';
        _print(mode, os, data.fields[i], mem);
      }
      os << '>';
      break;
    }

    case tag::pair: {
      // Momorize the pair so we dont print it multiple times in case of
      // self-referencing structures
      if (memq(val, mem))
      {
        os << "...";
        return;
      }
      mem = cons(val, mem);

      os << '(';
      _print(mode, os, car(val), mem);
      value elt;
      for (elt = cdr(val); ispair(elt); elt = cdr(elt))
      {
        // Similar trick about self-referencing
        if (memq(elt, mem))
        {
          os << " ...)";
          return;
        }
        mem = cons(elt, mem);

        os << ' ';
        _print(mode, os, car(elt), mem);
      }
      if (not isnil(elt))
      {
        os << " . ";
        _print(mode, os, elt, mem);
      }
      os << ')';
      break;
    }
  }
}

void
mm::write(std::ostream &os, value x)
{ _print(mode::write, os, x, nil); }

void
mm::display(std::ostream &os, value x)
{ _print(mode::display, os, x, nil); }
