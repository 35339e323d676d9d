/* SPDX-License-Identifier: LGPL-3.0-only */
#include <sys/syscall.h>
#include <unistd.h>

#include "pidset/PidSetError.hpp"
#include "pidset/system/EPoll.hpp"
#include "pidset/system/fd.hpp"

#include "pidset/system/PidFD.hpp"

#include "pidset/Log.hpp"
#define LOG(SEVERITY) pidset::log::SEVERITY("system/PidFD")

namespace pidset::system::unix
{

int PidFDSource::pidfdOpen(ExitHandle::PID Pid, unsigned int Flags) noexcept
{
  return static_cast<int>(::syscall(SYS_pidfd_open, Pid, Flags));
}

std::unique_ptr<ExitMultiplexer>
PidFDSource::createMultiplexer(std::size_t Capacity)
{
  return std::make_unique<EPoll>(Capacity);
}

ExitHandle PidFDSource::acquire(ExitHandle::PID Pid)
{
  fd PidFD = CheckedErrnoRaiseFor(
    PidSetErrc::ProcessLookupFailed,
    Pid,
    [Pid] { return pidfdOpen(Pid, 0); },
    "pidfd_open()",
    -1);
  PIDSET_TRACE_LOG(LOG(trace) << "PID " << Pid << " -> pidfd " << PidFD);
  return ExitHandle{Pid, std::move(PidFD)};
}

} // namespace pidset::system::unix

#undef LOG
