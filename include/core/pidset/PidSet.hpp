/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <initializer_list>
#include <iterator>
#include <map>
#include <memory>
#include <vector>

#include "pidset/PidSetError.hpp"
#include "pidset/system/ExitEvent.hpp"

namespace pidset
{

/// Monitors the termination of a set of processes without polling.
///
/// Every monitored PID is turned into a waitable exit handle, and all of them
/// are registered into a single multiplexer. The handles and the multiplexer
/// are allocated lazily, at the first wait (or at an explicit
/// \p initialize()), so constructing the object performs no system calls.
///
/// Observed exits are removed from the set, so the exit of a process is never
/// reported twice by the same instance.
///
/// Example:
///
///   \code{.cpp}
///   PidSet Children{FirstPID, SecondPID, ThirdPID};
///   Children.waitAny(); // Blocks until at least one of them exits.
///   Children.waitAll(); // Blocks until the rest of them exits.
///   Children.close();
///   \endcode
///
/// \note Duplicate PIDs collapse into a single monitored entry.
///
/// \note This object is \b NOT thread-safe! Concurrent use must be protected
/// by a lock around every call.
class PidSet
{
public:
  using PID = system::ExitHandle::PID;
  using Token = system::ExitMultiplexer::Token;

  /// Creates a monitor over \p PIDs using the platform's default backend.
  explicit PidSet(std::initializer_list<PID> PIDs);

  /// Creates a monitor over \p PIDs that uses \p Backend to obtain exit
  /// handles and the multiplexer.
  explicit PidSet(std::initializer_list<PID> PIDs,
                  std::unique_ptr<system::ExitEventSource> Backend);

  /// Creates a monitor over every PID in \p Range, which must be an iterable
  /// of integral process identifiers.
  template <typename Range,
            typename = decltype(std::begin(std::declval<const Range&>()))>
  explicit PidSet(const Range& PIDs)
    : PidSet(PIDs, system::ExitEventSource::createDefault())
  {}

  /// Creates a monitor over every PID in \p Range that uses \p Backend to
  /// obtain exit handles and the multiplexer.
  template <typename Range,
            typename = decltype(std::begin(std::declval<const Range&>()))>
  PidSet(const Range& PIDs, std::unique_ptr<system::ExitEventSource> Backend)
    : Source(std::move(Backend))
  {
    for (const auto& P : PIDs)
      track(static_cast<PID>(P));
  }

  PidSet(PidSet&&);
  PidSet& operator=(PidSet&&);
  PidSet(const PidSet&) = delete;
  PidSet& operator=(const PidSet&) = delete;

  /// Releases the multiplexer and every remaining handle, without reporting
  /// errors. Call \p close() to observe them.
  ~PidSet();

  /// Allocates the multiplexer and registers every monitored PID, if this has
  /// not happened yet. Waiting calls this automatically.
  ///
  /// If any registration fails, the registrations already made are undone,
  /// and the first error is propagated. The object remains uninitialised.
  ///
  /// \throws PidSetError \p MultiplexerCreateFailed, \p ProcessLookupFailed,
  /// \p AttachFailed, or \p UseAfterClose.
  void initialize();

  /// Blocks until at least one monitored process exits.
  ///
  /// \returns the number of exits observed, at least \p 1.
  std::size_t waitAny();

  /// Blocks until at least \p N monitored processes exit. Waiting for \p 0
  /// processes returns immediately, after the registration is done.
  ///
  /// \returns the number of exits observed, at least \p N. Exits reported
  /// by the system in the same batch are all consumed, even if this overshoots
  /// \p N.
  ///
  /// \throws PidSetError \p WaitCountExceedsTracked if fewer than \p N
  /// processes are monitored.
  std::size_t waitN(std::size_t N);

  /// Blocks until every monitored process exits. Returns without blocking if
  /// the set is empty.
  ///
  /// \returns the number of exits observed.
  std::size_t waitAll();

  /// Releases the multiplexer. Does nothing if no wait has ever happened, or
  /// if the object was already closed. The processes still being monitored
  /// are dropped without individually deregistering them.
  ///
  /// The object must not be used for waiting after this call.
  ///
  /// \throws PidSetError \p MultiplexerCloseFailed
  void close();

  [[nodiscard]] bool isInitialized() const noexcept
  {
    return static_cast<bool>(Multiplexer);
  }
  [[nodiscard]] bool isClosed() const noexcept { return Closed; }

  /// \returns the number of processes whose exit was not yet observed.
  [[nodiscard]] std::size_t size() const noexcept { return Tracked.size(); }
  [[nodiscard]] bool empty() const noexcept { return Tracked.empty(); }
  [[nodiscard]] bool contains(PID P) const noexcept
  {
    return Tracked.find(P) != Tracked.end();
  }
  /// \returns the processes whose exit was not yet observed, in ascending
  /// order.
  [[nodiscard]] std::vector<PID> pids() const;

private:
  std::unique_ptr<system::ExitEventSource> Source;
  std::unique_ptr<system::ExitMultiplexer> Multiplexer;
  /// The processes whose exit was not yet observed. Before initialisation,
  /// the handles are empty.
  std::map<PID, system::ExitHandle> Tracked;
  bool Closed = false;

  void track(PID P);
  void checkNotClosed() const;
  system::ExitMultiplexer& ensureInitialized();
  std::size_t wait(std::size_t N);

  /// Deregisters and releases the handle of a process whose exit was observed.
  /// Failures to deregister are logged, but the handle is released anyway.
  void drop(system::ExitHandle& H);
};

} // namespace pidset
