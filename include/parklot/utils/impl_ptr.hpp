/*
 * Copyright (C) 2021 Open Source Robotics Foundation
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
*/

#ifndef PARKLOT__UTILS__IMPL_PTR_HPP
#define PARKLOT__UTILS__IMPL_PTR_HPP

#include <memory>
#include <type_traits>

// A reduced form of the spimpl idiom (https://github.com/oliora/samples),
// which is distributed under the Boost Software License, Version 1.0.
//
// The deleter and copier are captured as function pointers at the point where
// the implementation is created, so the owning class only needs a complete
// definition of its Implementation inside its own source file.

namespace parklot {
namespace utils {
namespace details {

//==============================================================================
template<class T>
T* default_copy(const T* original)
{
  static_assert(sizeof(T) > 0 && !std::is_void<T>::value,
    "default_copy cannot copy an incomplete type");
  return new T(*original);
}

//==============================================================================
template<class T>
void default_delete(T* ptr)
{
  static_assert(sizeof(T) > 0 && !std::is_void<T>::value,
    "default_delete cannot delete an incomplete type");
  delete ptr;
}

//==============================================================================
template<class T>
using deleter_t = void (*)(T*);

//==============================================================================
template<class T>
using copier_t = T* (*)(const T*);

} // namespace details

//==============================================================================
/// Move-only owner of a private implementation.
template<class T>
class unique_impl_ptr
{
public:

  using pointer = T*;
  using const_pointer = const T*;

  unique_impl_ptr() noexcept
  : _ptr(nullptr, &details::default_delete<T>)
  {
    // Do nothing
  }

  unique_impl_ptr(pointer p, details::deleter_t<T> d) noexcept
  : _ptr(p, d)
  {
    // Do nothing
  }

  unique_impl_ptr(unique_impl_ptr&&) noexcept = default;
  unique_impl_ptr& operator=(unique_impl_ptr&&) noexcept = default;

  unique_impl_ptr(const unique_impl_ptr&) = delete;
  unique_impl_ptr& operator=(const unique_impl_ptr&) = delete;

  T& operator*() { return *_ptr; }
  const T& operator*() const { return *_ptr; }

  pointer operator->() noexcept { return _ptr.get(); }
  const_pointer operator->() const noexcept { return _ptr.get(); }

  pointer get() noexcept { return _ptr.get(); }
  const_pointer get() const noexcept { return _ptr.get(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_ptr); }

protected:
  std::unique_ptr<T, details::deleter_t<T>> _ptr;
};

//==============================================================================
/// Copyable owner of a private implementation. Copying the owner deep-copies
/// the implementation.
template<class T>
class impl_ptr : public unique_impl_ptr<T>
{
  using base_type = unique_impl_ptr<T>;
public:

  impl_ptr() noexcept
  : base_type(), _copier(&details::default_copy<T>)
  {
    // Do nothing
  }

  impl_ptr(
    T* p,
    details::deleter_t<T> d,
    details::copier_t<T> c) noexcept
  : base_type(p, d), _copier(c)
  {
    // Do nothing
  }

  impl_ptr(const impl_ptr& other)
  : impl_ptr(other.clone())
  {
    // Do nothing
  }

  impl_ptr& operator=(const impl_ptr& other)
  {
    if (this == &other)
      return *this;

    return *this = other.clone();
  }

  impl_ptr(impl_ptr&&) noexcept = default;
  impl_ptr& operator=(impl_ptr&&) noexcept = default;

  impl_ptr clone() const
  {
    return impl_ptr(
      base_type::_ptr ? _copier(base_type::_ptr.get()) : nullptr,
      base_type::_ptr.get_deleter(),
      _copier);
  }

private:
  details::copier_t<T> _copier;
};

//==============================================================================
template<class T, class... Args>
inline unique_impl_ptr<T> make_unique_impl(Args&&... args)
{
  return unique_impl_ptr<T>(
    new T(std::forward<Args>(args)...), &details::default_delete<T>);
}

//==============================================================================
template<class T, class... Args>
inline impl_ptr<T> make_impl(Args&&... args)
{
  return impl_ptr<T>(
    new T(std::forward<Args>(args)...),
    &details::default_delete<T>,
    &details::default_copy<T>);
}

} // namespace utils
} // namespace parklot

#endif // PARKLOT__UTILS__IMPL_PTR_HPP
