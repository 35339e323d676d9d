/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cassert>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "pidset/system/CurrentPlatform.hpp"
#include "pidset/system/ProcessTraits.hpp"

namespace pidset::system
{

/// A child of the current process. Owns the duty of reaping it, which the
/// exit monitor never does.
class Process
{
public:
  using Raw = ProcessTraits<CurrentPlatform>::RawTy;

  struct SpawnOptions
  {
    std::string Program;
    std::vector<std::string> Arguments;
    /// Overrides applied in the child before \p exec(). A \p std::nullopt
    /// value unsets the variable.
    std::map<std::string, std::optional<std::string>> Environment;
  };

  virtual ~Process() = default;

  Raw raw() const noexcept { return Handle; }

  /// Reaps the process without blocking if it has already terminated.
  ///
  /// \returns whether the process is dead. Once \p true, the PID may be
  /// reused by the system.
  virtual bool reapIfDead() = 0;

  /// Blocks until the process terminates, then reaps it.
  virtual void wait() = 0;

  /// \returns whether the process was reaped by this object.
  bool dead() const noexcept { return Dead; }

  /// \returns the exit status of a reaped process. A process killed by a
  /// signal reports the negated signal number. If someone else reaped the
  /// process, this is \p -1.
  int exitCode() const noexcept
  {
    assert(Dead && "Exit code of a running process!");
    return ExitCode;
  }

  /// Sends \p Signal to the process group of the child, unless it was
  /// already reaped.
  virtual void signal(int Signal) = 0;

protected:
  Raw Handle = ProcessTraits<CurrentPlatform>::Invalid;
  bool Dead = false;
  int ExitCode = 0;

public:
  /// \returns the PID of the calling process.
  static Raw thisProcess();

  /// Sends the \p Signal to the process group led by \p Handle.
  static void signal(Raw Handle, int Signal);

  /// Applies the environment of \p Opts to the \b calling process and
  /// replaces its image with \p Opts.Program, searched in \p PATH.
  ///
  /// \returns the cause of the failure. A successful call does not return.
  static std::error_code exec(const SpawnOptions& Opts);

  /// Forks a child that leads a new session and executes \p Opts. Returns
  /// once the program has been started in the child.
  ///
  /// \throws std::system_error if the fork, or the \p exec() in the child,
  /// failed. A child failing to start is reaped before the throw.
  static std::unique_ptr<Process> spawn(const SpawnOptions& Opts);
};

} // namespace pidset::system
