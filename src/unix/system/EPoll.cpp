/* SPDX-License-Identifier: LGPL-3.0-only */
#include <algorithm>
#include <cassert>

#include <unistd.h>

#include "pidset/CheckedErrno.hpp"
#include "pidset/PidSetError.hpp"

#include "pidset/system/EPoll.hpp"

#include "pidset/Log.hpp"
#define LOG(SEVERITY) pidset::log::SEVERITY("system/EventPoll")
#define LOG_WITH_IDENTIFIER(SEVERITY) LOG(SEVERITY) << MasterFD << ": "

namespace pidset::system::unix
{

EPoll::EPoll(std::size_t EventCount)
{
  Notifications.resize(std::max<std::size_t>(EventCount, 1));

  MasterFD = CheckedErrnoRaise(PidSetErrc::MultiplexerCreateFailed,
                               [] { return ::epoll_create1(EPOLL_CLOEXEC); },
                               "epoll_create1()",
                               -1);

  LOG_WITH_IDENTIFIER(debug) << "Created with " << getMaxEventCount()
                             << " events";
}

EPoll::~EPoll()
{
  if (MasterFD.has())
    LOG_WITH_IDENTIFIER(debug) << "~EPoll";
}

void EPoll::attach(const ExitHandle& H, Token T)
{
  POD<struct ::epoll_event> Control;
  Control->events = EPOLLIN;
  Control->data.u64 = T;

  CheckedErrnoRaiseFor(
    PidSetErrc::AttachFailed,
    H.pid(),
    [this, &Control, FD = H.raw()] {
      return ::epoll_ctl(MasterFD, EPOLL_CTL_ADD, FD, &Control);
    },
    "epoll_ctl(EPOLL_CTL_ADD)",
    -1);
  PIDSET_TRACE_LOG(LOG_WITH_IDENTIFIER(trace)
                   << "Listen for PID " << H.pid() << " (FD " << H.raw()
                   << ", token " << T << ')');
}

void EPoll::detach(const ExitHandle& H)
{
  // Kernels before 2.6.9 required a non-null event even for deletion.
  POD<struct ::epoll_event> Control;
  CheckedErrnoRaiseFor(
    PidSetErrc::DetachFailed,
    H.pid(),
    [this, &Control, FD = H.raw()] {
      return ::epoll_ctl(MasterFD, EPOLL_CTL_DEL, FD, &Control);
    },
    "epoll_ctl(EPOLL_CTL_DEL)",
    -1);
  PIDSET_TRACE_LOG(LOG_WITH_IDENTIFIER(trace)
                   << "Stop listening for PID " << H.pid() << " (FD "
                   << H.raw() << ')');
}

std::size_t EPoll::wait(std::size_t MaxEvents)
{
  NotificationCount = 0;
  const int Capacity = static_cast<int>(
    std::clamp<std::size_t>(MaxEvents, 1, getMaxEventCount()));

  PIDSET_TRACE_LOG(LOG_WITH_IDENTIFIER(trace) << "epoll_wait()...");
  auto MaybeFiredEventCount = CheckedErrno(
    [this, Capacity] {
      return ::epoll_wait(MasterFD, &(*Notifications.data()), Capacity, -1);
    },
    -1);
  if (!MaybeFiredEventCount)
  {
    std::error_code EC = MaybeFiredEventCount.getError();
    if (EC == std::errc::interrupted /* EINTR */)
      // Interrupting epoll_wait() is not an issue.
      return 0;
    throw PidSetError{PidSetErrc::WaitFailed, EC, "epoll_wait()"};
  }
  NotificationCount = MaybeFiredEventCount.get();

  PIDSET_TRACE_LOG(LOG_WITH_IDENTIFIER(trace)
                   << "epoll_wait()"
                   << " -> " << NotificationCount << " events");
  return NotificationCount;
}

bool EPoll::isValidIndex(std::size_t I) const noexcept
{
  return I < NotificationCount;
}

const struct ::epoll_event& EPoll::at(std::size_t Index) const
{
  assert(isValidIndex(Index) && "Read past the end of the buffer.");
  return *Notifications.at(Index);
}

EPoll::Token EPoll::tokenAt(std::size_t Index) const
{
  return at(Index).data.u64;
}

void EPoll::close()
{
  if (!MasterFD.has())
    return;

  LOG_WITH_IDENTIFIER(debug) << "Closing";
  if (std::error_code EC = MasterFD.close())
    throw PidSetError{PidSetErrc::MultiplexerCloseFailed, EC, "close()"};
}

} // namespace pidset::system::unix

#undef LOG_WITH_IDENTIFIER
#undef LOG
