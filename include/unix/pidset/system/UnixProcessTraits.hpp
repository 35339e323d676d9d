/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <sys/types.h>

#include "pidset/system/Platform.hpp"

namespace pidset::system
{

template <> struct ProcessTraits<PlatformTag::Unix>
{
  /// Type alias for the raw process handle type on the platform.
  using raw_handle = ::pid_t;
  using RawTy = raw_handle;

  /// A magic constant representing the invalid process identifier.
  static constexpr RawTy Invalid = -1;
};

} // namespace pidset::system
