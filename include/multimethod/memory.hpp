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

#include <gc.h>

#include <concepts>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <new>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

/**
 * \file memory.hpp
 * Garbage-collected storage for values, patterns and registries
 *
 * Everything reachable from a value lives in memory managed by the Boehm
 * collector. Containers that hold values must use gc_allocator so that the
 * collector can see through them; the `mm::stl` aliases do exactly that.
 *
 * \ingroup memory
 */

namespace mm {

/**
 * Create a garbage-collected object
 *
 * \tparam T The type of object to create
 * \param args Constructor arguments
 * \return Pointer to the newly created object
 *
 * \ingroup memory
 */
template <typename T, typename ...Args>
T*
make(Args&& ...args)
{
  T* obj = static_cast<T*>(GC_malloc(sizeof(T)));
  new (obj) T (std::forward<Args>(args)...);
  return obj;
}

/**
 * Create a garbage-collected object that never contains pointers into the
 * collected heap
 *
 * \ingroup memory
 */
template <typename T, typename ...Args>
T*
make_atomic(Args&& ...args)
{
  T* obj = static_cast<T*>(GC_malloc_atomic(sizeof(T)));
  new (obj) T (std::forward<Args>(args)...);
  return obj;
}

/**
 * Create an object that is scanned by the collector but never reclaimed
 *
 * Used for process-lifetime objects such as generic functions: whatever they
 * reference stays alive even when the object itself is only reachable from
 * the malloc heap.
 *
 * \ingroup memory
 */
template <typename T, typename ...Args>
T*
make_root(Args&& ...args)
{
  T* obj = static_cast<T*>(GC_malloc_uncollectable(sizeof(T)));
  new (obj) T (std::forward<Args>(args)...);
  return obj;
}

inline void*
allocate(size_t size)
{ return GC_malloc(size); }

inline void*
allocate_atomic(size_t size)
{ return GC_malloc_atomic(size); }


/**
 * Concept for raw memory allocators
 *
 * \ingroup memory
 */
template <typename T>
concept raw_allocator = requires(T a)
{
  { a(size_t{}) } -> std::convertible_to<void*>;
};

/**
 * STL-compatible allocator on top of the collector
 *
 * \ingroup memory
 */
template <typename T, raw_allocator RawAllocator>
struct gc_allocator_base {
  using value_type = T;
  using size_type = size_t;
  using difference_type = ptrdiff_t;
  using propagate_on_container_move_assignment = std::true_type;
  using is_always_equal = std::true_type;

  template <typename U>
  struct rebind {
    using other = gc_allocator_base<U, RawAllocator>;
  };

  gc_allocator_base() = default;

  template <typename U>
  gc_allocator_base(const gc_allocator_base<U, RawAllocator> &) noexcept
  { }

  T*
  allocate(size_type n)
  { return static_cast<T*>(RawAllocator {}(n * sizeof(T))); }

  void
  deallocate(T *p, [[maybe_unused]] size_type n) noexcept
  { GC_free(p); }

  template <typename U>
  bool
  operator == (const gc_allocator_base<U, RawAllocator> &) const noexcept
  { return true; }
}; // struct mm::gc_allocator_base

namespace detail {
struct allocate_wrapper {
  void* operator () (size_t nb) const noexcept { return mm::allocate(nb); }
}; // struct mm::detail::allocate_wrapper

struct allocate_uncollectable_wrapper {
  void* operator () (size_t nb) const noexcept
  { return GC_malloc_uncollectable(nb); }
}; // struct mm::detail::allocate_uncollectable_wrapper
} // namespace mm::detail

template <typename T>
using gc_allocator = gc_allocator_base<T, detail::allocate_wrapper>;

template <typename T>
using root_allocator = gc_allocator_base<T, detail::allocate_uncollectable_wrapper>;


/**
 * Create a shared object that is scanned by the collector and released with
 * its last owner
 *
 * For values that have to survive in storage the collector does not scan,
 * such as exception objects.
 *
 * \ingroup memory
 */
template <typename T, typename ...Args>
std::shared_ptr<T>
make_shared_root(Args&& ...args)
{ return std::allocate_shared<T>(root_allocator<T> {}, std::forward<Args>(args)...); }


/**
 * Wrap a callable into a std::function whose state lives in the collected
 * heap
 *
 * std::function keeps a closure that does not fit its inline buffer in malloc
 * memory, where the collector does not look. The closure is moved into a
 * collected object instead, and the returned function only holds a pointer to
 * it. The function must itself be stored where the collector looks.
 *
 * \ingroup memory
 */
template <typename Signature, typename F>
std::function<Signature>
gc_function(F &&f)
{
  using closure = std::decay_t<F>;
  closure *state = make<closure>(std::forward<F>(f));
  return [state] <typename ...Args> (Args&& ...args) -> decltype(auto)
  { return std::invoke(*state, std::forward<Args>(args)...); };
}


/**
 * \namespace mm::stl
 * Standard containers whose storage is visible to the collector
 *
 * \ingroup containers
 */
namespace stl {

template <typename T>
using vector = std::vector<T, gc_allocator<T>>;

template <typename Key, typename T, typename Compare = std::less<Key>>
using map = std::map<Key, T, Compare, gc_allocator<std::pair<const Key, T>>>;

template <
  typename Key,
  typename T,
  typename Hash = std::hash<Key>,
  typename KeyEqual = std::equal_to<Key>
>
using unordered_map = std::unordered_map<Key, T, Hash, KeyEqual,
                                         gc_allocator<std::pair<const Key, T>>>;

template <typename T, typename Hash = std::hash<T>,
          typename Equal = std::equal_to<T>>
using unordered_set = std::unordered_set<T, Hash, Equal, gc_allocator<T>>;

using string = std::basic_string<char, std::char_traits<char>, gc_allocator<char>>;

} // namespace mm::stl

} // namespace mm
