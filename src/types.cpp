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


#include "multimethod/types.hpp"
#include "multimethod/exceptions.hpp"
#include "multimethod/logging.hpp"

#include <format>


////////////////////////////////////////////////////////////////////////////////
//
//                             Builtin types
//
const mm::type mm::types::any {"any", nullptr, nullptr};
const mm::type mm::types::null {"null", &any, nullptr};
const mm::type mm::types::boolean {"boolean", &any, nullptr};
const mm::type mm::types::number {"number", &any, nullptr};
const mm::type mm::types::integer {"integer", &number, nullptr};
const mm::type mm::types::real {"real", &number, nullptr};
const mm::type mm::types::string {"string", &any, nullptr};
const mm::type mm::types::symbol {"symbol", &any, nullptr};
const mm::type mm::types::pair {"pair", &any, nullptr};
const mm::type mm::types::table {"table", &any, nullptr};
static const mm::record_layout g_empty_layout {};
const mm::type mm::types::record {"record", &any, &g_empty_layout};
const mm::type mm::types::type_descriptor {"type", &any, nullptr};
const mm::type mm::types::pattern {"pattern", &any, nullptr};
const mm::type mm::types::pointer {"pointer", &any, nullptr};


namespace {

// Storage of a user-declared record type; never reclaimed
struct record_type_storage {
  record_type_storage(std::string_view name, const mm::type &parent)
  : name {name},
    rtype {this->name, &parent, &layout}
  { }

  mm::stl::string name;
  mm::record_layout layout;
  mm::type rtype;
}; // struct record_type_storage

} // anonymous namespace


const mm::type&
mm::make_record_type(std::string_view name,
                     std::initializer_list<std::string_view> fields,
                     const type &parent)
{
  if (not is_subtype(parent, types::record))
  {
    throw std::invalid_argument {
        std::format("make_record_type() - parent of {} is not a record type "
                    "({})", name, parent.name)};
  }

  record_type_storage *storage = make_root<record_type_storage>(name, parent);
  storage->layout.fields = parent.layout->fields;
  for (const std::string_view fieldname : fields)
  {
    const value fieldsym = sym(fieldname);
    if (member(fieldsym, list_of(storage->layout.fields)))
    {
      throw std::invalid_argument {
          std::format("make_record_type() - duplicate field {} in {}",
                      fieldname, name)};
    }
    storage->layout.fields.push_back(fieldsym);
  }

  debug("declared record type {} with {} field(s)", name,
        storage->layout.fields.size());
  return storage->rtype;
}


mm::value
mm::make_record(const type &rtype, std::initializer_list<value> fields)
{
  if (rtype.layout == nullptr)
  {
    throw std::invalid_argument {
        std::format("make_record() - {} is not a record type", rtype.name)};
  }
  if (fields.size() != rtype.layout->fields.size())
  {
    throw std::invalid_argument {
        std::format("make_record() - {} expects {} field(s), got {}",
                    rtype.name, rtype.layout->fields.size(), fields.size())};
  }

  record_data *data = make<record_data>();
  data->rtype = &rtype;
  data->fields.assign(fields.begin(), fields.end());

  value ret {make<object>(tag::record)};
  ret->record = data;
  return ret;
}


bool
mm::record_find(value r, std::string_view name, value &result) noexcept
{
  if (not isrecord(r))
    return false;

  const record_data &data = *r->record;
  const auto &names = data.rtype->layout->fields;
  for (size_t i = 0; i < names.size(); ++i)
  {
    if (issym(names[i], name))
    {
      result = data.fields[i];
      return true;
    }
  }
  return false;
}


mm::value
mm::field(value r, std::string_view name)
{
  if (not isrecord(r))
    throw lookup_error {std::format("field() - not a record: {}", r)};
  value result;
  if (not record_find(r, name, result))
  {
    throw lookup_error {
        std::format("field() - {} has no field {}", r->record->rtype->name,
                    name)};
  }
  return result;
}


const mm::type&
mm::type_of(value x) noexcept
{
  switch (tag(x))
  {
    case tag::nil: return types::null;
    case tag::boolean: return types::boolean;
    case tag::integer: return types::integer;
    case tag::real: return types::real;
    case tag::str: return types::string;
    case tag::sym: return types::symbol;
    case tag::pair: return types::pair;
    case tag::table: return types::table;
    case tag::record: return *x->record->rtype;
    case tag::type: return types::type_descriptor;
    case tag::pattern: return types::pattern;
    case tag::ptr: return types::pointer;
  }
  std::terminate();
}


bool
mm::is_subtype(const type &a, const type &b) noexcept
{
  for (const type *t = &a; t != nullptr; t = t->parent)
  {
    if (t == &b)
      return true;
  }
  return false;
}
