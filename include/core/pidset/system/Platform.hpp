/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include "pidset/Config.h"

namespace pidset::system
{

enum class PlatformTag
{
  Unsupported = PIDSET_PLATFORM_ID_Unsupported,

  /// Linux, the only system offering both a per-process waitable handle
  /// (\p pidfd_open(2)) and a readiness multiplexer (\p epoll(7)).
  Unix = PIDSET_PLATFORM_ID_Unix
};

/// Raw handle type and release operation of a platform, used by \p Handle.
template <PlatformTag> struct HandleTraits
{};

/// Raw process identifier type of a platform, used by \p Process.
template <PlatformTag> struct ProcessTraits
{};

} // namespace pidset::system
