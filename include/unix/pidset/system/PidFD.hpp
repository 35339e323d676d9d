/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include "pidset/system/ExitEvent.hpp"

namespace pidset::system::unix
{

/// Creates \p ExitHandle instances from \p pidfd_open(2) process file
/// descriptors, and \p EPoll multiplexers to wait on them.
///
/// A process file descriptor refers to the process instance that was alive
/// at the time of the call, so a later reuse of the PID by the kernel does not
/// confuse the handle. The descriptor becomes readable when the process
/// terminates (turns into a zombie), irrespective of whether the process is a
/// child of the current one.
class PidFDSource : public system::ExitEventSource
{
public:
  /// Wraps the \p pidfd_open(2) system call, which might not have a libc
  /// wrapper available.
  ///
  /// \returns the new file descriptor, or \p -1 with \p errno set.
  static int pidfdOpen(ExitHandle::PID Pid, unsigned int Flags) noexcept;

  [[nodiscard]] std::unique_ptr<ExitMultiplexer>
  createMultiplexer(std::size_t Capacity) override;

  [[nodiscard]] ExitHandle acquire(ExitHandle::PID Pid) override;
};

} // namespace pidset::system::unix
