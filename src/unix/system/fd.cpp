/* SPDX-License-Identifier: LGPL-3.0-only */
#include <unistd.h>

#include "pidset/CheckedErrno.hpp"

#include "pidset/system/fd.hpp"

#include "pidset/Log.hpp"
#define LOG(SEVERITY) pidset::log::SEVERITY("system/fd")

namespace pidset::system
{

void HandleTraits<PlatformTag::Unix>::close(raw_fd FD) noexcept
{
  PIDSET_TRACE_LOG(LOG(data) << "Closing FD #" << FD << "...");
  auto Closed = CheckedErrno([FD] { return ::close(FD); }, -1);
  if (!Closed)
    LOG(debug) << "Closing FD #" << FD
               << " failed: " << Closed.getError().message();
}

namespace unix
{

fd::fd(raw_fd Value) noexcept : Handle(Value) {}

std::error_code fd::close() noexcept
{
  if (!has())
    return {};

  PIDSET_TRACE_LOG(LOG(data) << "Closing FD #" << get() << " (checked)...");
  auto Closed = CheckedErrno([FD = release()] { return ::close(FD); }, -1);
  if (!Closed)
    return Closed.getError();
  return {};
}

bool fd::hasDescriptorFlag(raw_fd FD, flag_t Flag)
{
  flag_t FlagsNow = CheckedErrnoThrow(
    [FD] { return ::fcntl(FD, F_GETFD); }, "fcntl(F_GETFD)", -1);
  return (FlagsNow & Flag) == Flag;
}

} // namespace unix
} // namespace pidset::system

#undef LOG
