/*
 * tinysexpr - Lazy S-expression reader with exact source coordinates
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

#include <cstddef>
#include <new>
#include <utility>
#include <type_traits>

/**
 * \file memory.hpp
 * Collector-managed storage for parsed forms
 *
 * Forms are immutable once built and may be shared freely between the
 * caller's data structures, so they are allocated with the Boehm GC. A form
 * stays alive as long as some handle to it is reachable from the stack, from
 * static storage or from another collector-managed block.
 *
 * \ingroup memory
 */

/**
 * \namespace tsx
 * The main namespace of the tinysexpr library
 */
namespace tsx {

/**
 * Construct an object in collector-managed memory
 *
 * The destructor of the object is never run.
 *
 * \tparam T Type of the object
 * \param args Constructor arguments
 * \return Pointer to the new object
 *
 * \ingroup memory
 */
template <typename T, typename ...Args>
T*
make(Args&& ...args)
{
  T *obj = static_cast<T*>(GC_malloc(sizeof(T)));
  if (obj == nullptr)
    throw std::bad_alloc {};
  new (obj) T (std::forward<Args>(args)...);
  return obj;
}


/**
 * Standard allocator on top of the collector
 *
 * Used for the element vectors of forms and for atom text, so that every
 * pointer reachable from a form lives in memory the collector scans.
 *
 * \ingroup memory
 */
template <typename T>
struct gc_allocator {
  using value_type = T;
  using size_type = size_t;
  using difference_type = ptrdiff_t;
  using propagate_on_container_move_assignment = std::true_type;
  using is_always_equal = std::true_type;

  gc_allocator() noexcept = default;

  template <typename U>
  gc_allocator(const gc_allocator<U> &) noexcept
  { }

  T*
  allocate(size_type n)
  {
    void *ptr = GC_malloc(n * sizeof(T));
    if (ptr == nullptr)
      throw std::bad_alloc {};
    return static_cast<T*>(ptr);
  }

  void
  deallocate(T *p, [[maybe_unused]] size_type n) noexcept
  { GC_free(p); }

  template <typename U>
  bool
  operator == (const gc_allocator<U> &) const noexcept
  { return true; }

  template <typename U>
  bool
  operator != (const gc_allocator<U> &) const noexcept
  { return false; }
}; // struct tsx::gc_allocator

} // namespace tsx
