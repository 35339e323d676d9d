/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <fcntl.h>

#include "pidset/system/Platform.hpp"

namespace pidset::system
{

template <> struct HandleTraits<PlatformTag::Unix>
{
  using raw_fd = decltype(::open("", 0));
  using RawTy = raw_fd;

  static constexpr RawTy Invalid = -1;

  /// Calls \p close(2) on \p FD. A failure is only logged.
  static void close(RawTy FD) noexcept;
};

} // namespace pidset::system
