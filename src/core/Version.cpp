/* SPDX-License-Identifier: LGPL-3.0-only */
#include "pidset/Version.h"

#include "pidset/Version.hpp"

namespace pidset
{

Version getVersion() noexcept
{
  return Version{PIDSET_VERSION_MAJOR,
                 PIDSET_VERSION_MINOR,
                 PIDSET_VERSION_PATCH,
                 PIDSET_VERSION_TWEAK};
}

std::string getShortVersion()
{
  Version V = getVersion();
  std::string R = std::to_string(V.Major) + '.' + std::to_string(V.Minor) +
                  '.' + std::to_string(V.Patch);
  if (V.Tweak)
    R += '.' + std::to_string(V.Tweak);
  return R;
}

} // namespace pidset
