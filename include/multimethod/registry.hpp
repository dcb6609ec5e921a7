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

#include "multimethod/arguments.hpp"
#include "multimethod/hash.hpp"
#include "multimethod/value.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

/**
 * \file registry.hpp
 * Ordered method table of a generic function
 *
 * \ingroup dispatch
 */


namespace mm {

/**
 * Implementation of a generic function for one dispatch key
 *
 * Receives the arguments as transformed by the patterns that selected it.
 *
 * \ingroup dispatch
 */
using method = std::function<value(const arguments &args)>;

/** Positional spec tokens */
using spec_list = stl::vector<value>;

/** Keyword spec tokens, ordered by argument name */
using keyword_specs = stl::map<std::string, value, std::less<>>;


/**
 * Build a spec list from C++ values; every token goes through from()
 *
 * \ingroup dispatch
 */
template <typename ...Specs>
[[nodiscard]] spec_list
specs(Specs&& ...tokens)
{ return spec_list {from(std::forward<Specs>(tokens))...}; }


/**
 * Dispatch key as a value: `((spec ...) (name . spec) ...)`
 *
 * Keyword names become symbols and keep the alphabetical order of the map.
 *
 * \ingroup dispatch
 */
[[nodiscard]] value
dispatch_key(const spec_list &specs, const keyword_specs &kwspecs);


/**
 * Registry entry
 *
 * \ingroup dispatch
 */
struct method_entry {
  spec_list specs;
  keyword_specs kwspecs;
  const method *impl;
}; // struct mm::method_entry


/**
 * Insertion-ordered mapping from dispatch keys to methods
 *
 * The order of entries is the order in which their keys were first
 * inserted. Inserting a key that is already present replaces the method in
 * its original slot.
 *
 * Readers work on immutable snapshots: insert() copies the current snapshot,
 * modifies the copy and publishes it, so a dispatch that took a snapshot
 * keeps seeing the same entries until it is done. Writers are serialized
 * with a mutex. Retired snapshots are left to the collector.
 *
 * \ingroup dispatch
 */
class registry {
  public:
  struct snapshot {
    stl::vector<method_entry> entries;
    stl::unordered_map<value, size_t> index; /**< dispatch_key() -> entry */
  }; // struct mm::registry::snapshot

  registry();

  registry(const registry&) = delete;
  void operator = (const registry&) = delete;

  /**
   * Insert or replace a method
   *
   * \return True if the key was new, false if an existing method was replaced
   */
  bool
  insert(spec_list specs, keyword_specs kwspecs, method impl);

  /**
   * Exact-key lookup
   *
   * \return The method registered under the key, or nullptr
   */
  [[nodiscard]] const method*
  lookup(const spec_list &specs, const keyword_specs &kwspecs = {}) const;

  /**
   * Current snapshot
   *
   * Stays valid (and unchanged) for as long as the caller holds the pointer.
   */
  [[nodiscard]] const snapshot*
  current() const noexcept
  { return m_snapshot.load(std::memory_order_acquire); }

  [[nodiscard]] size_t
  size() const noexcept
  { return current()->entries.size(); }

  private:
  std::mutex m_write_mutex;
  std::atomic<const snapshot*> m_snapshot;
}; // class mm::registry

} // namespace mm
