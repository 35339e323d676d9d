/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <memory>
#include <vector>

#include "pidset/PidSet.hpp"
#include "pidset/system/Process.hpp"

namespace pidset
{

class RunningSupervisor;

/// A group of commands that are configured, but not yet started.
///
/// The only thing that can be done with a configured group, apart from adding
/// more commands, is to \p spawn() it, which consumes the object and turns it
/// into a \p RunningSupervisor.
///
/// Example:
///
///   \code{.cpp}
///   CommandSupervisor Group;
///   Group.add({"sleep", {"1"}, {}}).add({"sleep", {"2"}, {}});
///   RunningSupervisor Running = std::move(Group).spawn();
///   Running.waitAll();
///   \endcode
class CommandSupervisor
{
public:
  using Command = system::Process::SpawnOptions;

  CommandSupervisor() = default;
  explicit CommandSupervisor(std::vector<Command> Commands);

  CommandSupervisor& add(Command C);

  [[nodiscard]] std::size_t size() const noexcept { return Commands.size(); }
  [[nodiscard]] const std::vector<Command>& commands() const noexcept
  {
    return Commands;
  }

  /// Starts every command, in order, and begins monitoring their exits.
  ///
  /// If starting any of the commands fails, the ones already started are
  /// killed and reaped before the error is propagated.
  [[nodiscard]] RunningSupervisor spawn() &&;

  /// Same as \p spawn(), but the exits are monitored through \p Backend.
  [[nodiscard]] RunningSupervisor
  spawn(std::unique_ptr<system::ExitEventSource> Backend) &&;

private:
  std::vector<Command> Commands;
};

/// A group of started child processes whose exits are monitored by a
/// \p PidSet.
///
/// Children whose exit was observed are reaped, so they do not linger as
/// zombies. Destroying the object does \b NOT kill the children still running.
class RunningSupervisor
{
public:
  using PID = PidSet::PID;

  /// Blocks until at least one child exits.
  ///
  /// The children observed to exit are reaped, even if the wait fails
  /// afterwards.
  std::size_t waitAny();
  /// Blocks until at least \p N children exit.
  std::size_t waitN(std::size_t N);
  /// Blocks until every child exits.
  std::size_t waitAll();

  /// Stops monitoring the children.
  void close();

  /// \returns the PIDs of every started child, in the order of the commands.
  [[nodiscard]] std::vector<PID> pids() const;
  /// \returns the PIDs of the children whose exit was not yet observed.
  [[nodiscard]] std::vector<PID> running() const { return Monitor.pids(); }

  [[nodiscard]] const std::vector<std::unique_ptr<system::Process>>&
  children() const noexcept
  {
    return Children;
  }

private:
  friend class CommandSupervisor;

  RunningSupervisor(std::vector<std::unique_ptr<system::Process>> Children,
                    std::unique_ptr<system::ExitEventSource> Backend);

  std::vector<std::unique_ptr<system::Process>> Children;
  PidSet Monitor;

  /// Reaps every child whose exit was observed by \p Monitor. Failures are
  /// only logged.
  void reapObserved() noexcept;
};

} // namespace pidset
