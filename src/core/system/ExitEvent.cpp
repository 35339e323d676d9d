/* SPDX-License-Identifier: LGPL-3.0-only */
#include "pidset/Config.h"

#include "pidset/system/ExitEvent.hpp"

#ifdef PIDSET_PLATFORM_UNIX
#include "pidset/system/PidFD.hpp"
#endif /* PIDSET_PLATFORM_UNIX */

namespace pidset::system
{

ExitHandle::ExitHandle(PID Pid, Handle H) noexcept
  : Pid(Pid), OSHandle(std::move(H))
{}

std::unique_ptr<ExitEventSource> ExitEventSource::createDefault()
{
#ifdef PIDSET_PLATFORM_UNIX
  return std::make_unique<unix::PidFDSource>();
#else
  return nullptr;
#endif /* PIDSET_PLATFORM_UNIX */
}

} // namespace pidset::system
