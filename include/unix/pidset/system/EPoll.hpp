/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <vector>

#include <sys/epoll.h>

#include "pidset/adt/POD.hpp"
#include "pidset/system/ExitEvent.hpp"
#include "pidset/system/fd.hpp"

namespace pidset::system::unix
{

/// A type-safe wrapper over an \p epoll(7) event polling structure.
/// \p epoll(7) works as an I/O event notification system similarly to the
/// hopefully widely known \p select(2) kernel functionality.
///
/// \p EPoll registers a file descriptor internal to the process which will be
/// notified by the kernel if some of the registered files undergo an I/O
/// change. For process file descriptors, this change is the termination of
/// the process, signalled as \p EPOLLIN.
///
/// Every registration carries a 64-bit token in \p epoll_data::u64, which is
/// reported back verbatim when the registered file fires.
class EPoll : public system::ExitMultiplexer
{
public:
  /// Create a new \p epoll(7) structure associated with the current process.
  ///
  /// The structure is initialised to report at most \p EventCount events in
  /// a single \p wait(). (A zero count is rounded up to one.)
  explicit EPoll(std::size_t EventCount);

  ~EPoll() override;

  /// Get the number of events that fired in the last successful \p wait().
  [[nodiscard]] std::size_t getEventCount() const noexcept
  {
    return NotificationCount;
  }

  [[nodiscard]] std::size_t getMaxEventCount() const noexcept
  {
    return Notifications.size();
  }

  /// \returns the raw \p epoll(7) file descriptor, or \p fd::Traits::Invalid
  /// if the object was closed.
  [[nodiscard]] fd::raw_fd raw() const noexcept { return MasterFD.get(); }

  /// Retrieve the Nth event.
  [[nodiscard]] const struct ::epoll_event& at(std::size_t Index) const;

  void attach(const ExitHandle& H, Token T) override;

  void detach(const ExitHandle& H) override;

  [[nodiscard]] std::size_t wait(std::size_t MaxEvents) override;

  [[nodiscard]] Token tokenAt(std::size_t Index) const override;

  void close() override;

private:
  /// The file descriptor registered in the system for the event structure.
  fd MasterFD;

  /// Contains the events that fired and triggered a notification from the
  /// system.
  std::vector<POD<struct ::epoll_event>> Notifications;

  std::size_t NotificationCount = 0;

  [[nodiscard]] bool isValidIndex(std::size_t I) const noexcept;
};

} // namespace pidset::system::unix
