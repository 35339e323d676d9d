/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cstring>
#include <type_traits>

namespace pidset
{

/// This class wraps a C-style struct, a "Plain Old Data" (POD) into a C++
/// structure which ensures that the data is created zero-filled, so that
/// kernel structures such as \p epoll_event never carry garbage into a system
/// call.
template <typename T> struct POD
{
  static_assert(std::is_standard_layout_v<T> && std::is_trivial_v<T>,
                "Only supporting PODs!");

  T& operator*() noexcept { return Data; }
  const T& operator*() const noexcept { return Data; }
  T* operator&() noexcept { return &Data; }
  const T* operator&() const noexcept { return &Data; }
  T* operator->() noexcept { return &Data; }
  const T* operator->() const noexcept { return &Data; }
  operator T&() noexcept { return Data; }
  operator const T&() const noexcept { return Data; }

  /// Creates an empty space where \p T fits.
  POD() noexcept
  {
    static_assert(sizeof(*this) == sizeof(T), "Extra padding is forbidden!");
    reset();
  }

  /// Zerofill the memory area of the contained object.
  void reset() noexcept { std::memset(&Data, 0, sizeof(T)); }

private:
  T Data;
};

} // namespace pidset
