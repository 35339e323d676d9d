/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cstdint>
#include <memory>

#include "pidset/system/CurrentPlatform.hpp"
#include "pidset/system/Handle.hpp"
#include "pidset/system/ProcessTraits.hpp"

namespace pidset::system
{

using PlatformSpecificProcessTraits = ProcessTraits<CurrentPlatform>;

/// A waitable OS handle that refers to one specific process instance, and
/// becomes "ready" exactly once: when that process terminates.
///
/// The handle is owned exclusively. It must be detached from any multiplexer
/// it was attached to before it is destroyed.
class ExitHandle
{
public:
  using PID = PlatformSpecificProcessTraits::RawTy;

  /// Creates an empty handle that does not refer to any process.
  ExitHandle() noexcept = default;

  /// Takes ownership of the OS-level \p H that refers to the process \p Pid.
  ExitHandle(PID Pid, Handle H) noexcept;

  ExitHandle(ExitHandle&&) noexcept = default;
  ExitHandle& operator=(ExitHandle&&) noexcept = default;

  [[nodiscard]] PID pid() const noexcept { return Pid; }
  [[nodiscard]] Handle::Raw raw() const noexcept { return OSHandle.get(); }

  /// \returns whether an OS resource is owned.
  [[nodiscard]] bool has() const noexcept { return OSHandle.has(); }

  /// Closes the owned OS resource, if any.
  void reset() noexcept { OSHandle.reset(); }

private:
  PID Pid = PlatformSpecificProcessTraits::Invalid;
  Handle OSHandle;
};

/// Implements waiting for many \p ExitHandle instances at once, mapping a
/// readiness notification back to a caller-chosen \p Token.
class ExitMultiplexer
{
public:
  using Token = std::uint64_t;

  virtual ~ExitMultiplexer() = default;

  /// Registers the exit condition of \p H, to be reported as \p T.
  ///
  /// \throws PidSetError \p AttachFailed
  virtual void attach(const ExitHandle& H, Token T) = 0;

  /// Removes the registration of \p H. Must be called at most once for every
  /// successful \p attach().
  ///
  /// \throws PidSetError \p DetachFailed
  virtual void detach(const ExitHandle& H) = 0;

  /// Blocks, without a timeout, until at least one attached handle becomes
  /// ready.
  ///
  /// \return The number of ready events in the batch, at most \p MaxEvents.
  /// An interrupted wait returns \p 0.
  ///
  /// \throws PidSetError \p WaitFailed
  [[nodiscard]] virtual std::size_t wait(std::size_t MaxEvents) = 0;

  /// \returns the token of the \p Index th event of the last batch.
  [[nodiscard]] virtual Token tokenAt(std::size_t Index) const = 0;

  /// Releases the multiplexer, reporting the failure of the release. The
  /// object must not be used afterwards.
  ///
  /// \throws PidSetError \p MultiplexerCloseFailed
  virtual void close() = 0;

protected:
  ExitMultiplexer() = default;
};

/// Produces the OS resources needed to monitor process exits: one
/// \p ExitHandle per process, and the \p ExitMultiplexer that waits for them.
class ExitEventSource
{
public:
  virtual ~ExitEventSource() = default;

  /// \returns the source implementation for the current platform.
  [[nodiscard]] static std::unique_ptr<ExitEventSource> createDefault();

  /// Creates a multiplexer sized for \p Capacity handles.
  ///
  /// \throws PidSetError \p MultiplexerCreateFailed
  [[nodiscard]] virtual std::unique_ptr<ExitMultiplexer>
  createMultiplexer(std::size_t Capacity) = 0;

  /// Obtains a waitable handle bound to the live process \p Pid. This call
  /// does not block.
  ///
  /// \throws PidSetError \p ProcessLookupFailed
  [[nodiscard]] virtual ExitHandle acquire(ExitHandle::PID Pid) = 0;

protected:
  ExitEventSource() = default;
};

} // namespace pidset::system
