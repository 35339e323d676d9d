/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include "pidset/Config.h"
#include "pidset/system/Platform.hpp"

namespace pidset::system
{

/// The platform the library is configured for, selecting the specialisations
/// of \p HandleTraits and \p ProcessTraits in use.
static constexpr PlatformTag CurrentPlatform =
  static_cast<PlatformTag>(PIDSET_PLATFORM_ID);

static_assert(CurrentPlatform != PlatformTag::Unsupported,
              "Process exit monitoring needs pidfd and epoll support");

} // namespace pidset::system
