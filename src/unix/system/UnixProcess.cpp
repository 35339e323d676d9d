/* SPDX-License-Identifier: LGPL-3.0-only */
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <utility>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "pidset/CheckedErrno.hpp"
#include "pidset/adt/POD.hpp"
#include "pidset/system/fd.hpp"

#include "pidset/system/UnixProcess.hpp"

#include "pidset/Log.hpp"
#define LOG(SEVERITY) pidset::log::SEVERITY("system/Process")

namespace pidset::system
{

namespace
{

/// The \p argv array of a program to be executed. The strings are borrowed
/// from the \p SpawnOptions and must outlive the object.
std::vector<char*> makeArgv(const Process::SpawnOptions& Opts)
{
  std::vector<char*> Argv;
  Argv.reserve(Opts.Arguments.size() + 2);
  Argv.emplace_back(const_cast<char*>(Opts.Program.c_str()));
  for (const std::string& Arg : Opts.Arguments)
    Argv.emplace_back(const_cast<char*>(Arg.c_str()));
  Argv.emplace_back(nullptr);
  return Argv;
}

/// \returns the number of bytes read into \p Buffer, retrying interrupted
/// reads. \p 0 means the write end was closed.
std::size_t readFully(unix::fd::raw_fd FD, void* Buffer, std::size_t Size)
{
  std::size_t Done = 0;
  while (Done < Size)
  {
    auto Read = CheckedErrno(
      [FD, Buffer, Size, Done] {
        return ::read(FD, static_cast<char*>(Buffer) + Done, Size - Done);
      },
      -1);
    if (!Read)
    {
      if (Read.getError() == std::errc::interrupted)
        continue;
      throw std::system_error{Read.getError(), "read() of exec status"};
    }
    if (Read.get() == 0)
      break;
    Done += static_cast<std::size_t>(Read.get());
  }
  return Done;
}

} // namespace

Process::Raw Process::thisProcess()
{
  return CheckedErrnoThrow([] { return ::getpid(); }, "getpid()", -1);
}

std::error_code Process::exec(const SpawnOptions& Opts)
{
  PIDSET_TRACE_LOG(LOG(trace) << "exec(" << Opts.Program << ") with "
                              << Opts.Arguments.size() << " arguments");

  for (const auto& E : Opts.Environment)
  {
    auto Applied =
      E.second ? CheckedErrno(
                   [&K = E.first, &V = *E.second] {
                     return ::setenv(K.c_str(), V.c_str(), 1);
                   },
                   -1)
               : CheckedErrno(
                   [&K = E.first] { return ::unsetenv(K.c_str()); }, -1);
    if (!Applied)
      return Applied.getError();
  }

  std::vector<char*> Argv = makeArgv(Opts);
  // execvp() only ever returns on failure.
  return CheckedErrno([&Argv] { return ::execvp(Argv[0], Argv.data()); }, -1)
    .getError();
}

std::unique_ptr<Process> Process::spawn(const SpawnOptions& Opts)
{
  // The child reports a failing exec() through this pipe. A successful exec()
  // closes the write end, as it is close-on-exec.
  int StatusPipe[2];
  CheckedErrnoThrow([&StatusPipe] { return ::pipe2(StatusPipe, O_CLOEXEC); },
                    "pipe2() failed in spawn()",
                    -1);
  unix::fd StatusRead{StatusPipe[0]};
  unix::fd StatusWrite{StatusPipe[1]};

  Raw ForkResult =
    CheckedErrnoThrow([] { return ::fork(); }, "fork() failed in spawn()", -1);
  if (ForkResult == 0)
  {
    // We are in the child.
    auto Session = CheckedErrno([] { return ::setsid(); }, -1);
    std::error_code EC = Session ? exec(Opts) : Session.getError();

    errno_t Status = EC.value();
    auto Reported = CheckedErrno(
      [FD = StatusWrite.get(), &Status] {
        return ::write(FD, &Status, sizeof(Status));
      },
      -1);
    std::_Exit(Reported ? EXIT_FAILURE : 127);
  }

  // We are in the parent.
  std::unique_ptr<Process> P = std::make_unique<unix::Process>();
  P->Handle = ForkResult;
  StatusWrite.reset();

  errno_t ChildStatus = 0;
  std::size_t StatusSize = 0;
  try
  {
    StatusSize = readFully(StatusRead, &ChildStatus, sizeof(ChildStatus));
  }
  catch (const std::system_error& E)
  {
    LOG(error) << "Lost the start status of PID " << ForkResult << ": "
               << E.what();
    // The child might not lead its own process group yet.
    auto Killed = CheckedErrno(
      [ForkResult] { return ::kill(ForkResult, SIGKILL); }, -1);
    if (!Killed)
      LOG(warn) << "Failed to kill PID " << ForkResult << ": "
                << Killed.getError().message();
    P->wait();
    throw;
  }

  if (StatusSize != 0)
  {
    // Any status means exec() did not happen, the child exits by itself.
    P->wait();
    if (StatusSize != sizeof(ChildStatus))
      throw std::system_error{std::make_error_code(std::errc::io_error),
                              "exec(" + Opts.Program +
                                ") failed, with a truncated status"};
    LOG(debug) << "Starting '" << Opts.Program << "' failed in PID "
               << ForkResult;
    throw std::system_error{
      std::make_error_code(static_cast<std::errc>(ChildStatus)),
      "exec(" + Opts.Program + ")"};
  }

  LOG(debug) << "PID " << ForkResult << " spawned for '" << Opts.Program
             << '\'';
  return P;
}

static std::pair<bool, int> reapAndGetExitCode(Process::Raw PID, bool Block)
{
  if (PID == ProcessTraits<CurrentPlatform>::Invalid)
    return {true, -1};

  POD<int> WaitStatus;
  auto ChangedPID = CheckedErrno(
    [&WaitStatus, PID, Block] {
      return ::waitpid(PID, &WaitStatus, !Block ? WNOHANG : 0);
    },
    -1);
  while (Block && !ChangedPID && ChangedPID.getError() == std::errc::interrupted)
    ChangedPID = CheckedErrno(
      [&WaitStatus, PID] { return ::waitpid(PID, &WaitStatus, 0); }, -1);
  if (!ChangedPID)
  {
    std::error_code EC = ChangedPID.getError();
    if (EC == std::errc::no_child_process /* ECHILD */)
      // Reaped by someone else, the exit code is lost.
      return {true, -1};
    throw std::system_error{EC, "waitpid(" + std::to_string(PID) + ")"};
  }
  if (ChangedPID.get() != PID)
    // WNOHANG and the child is still running.
    return {false, 0};

  PIDSET_TRACE_LOG(LOG(trace) << "Reaped child PID " << PID);
  if (WIFEXITED(*WaitStatus))
    return {true, WEXITSTATUS(*WaitStatus)};
  if (WIFSIGNALED(*WaitStatus))
    return {true, -(WTERMSIG(*WaitStatus))};

  return {false, 0};
}

namespace unix
{

bool Process::reapIfDead()
{
  if (Dead)
    return true;

  std::pair<bool, int> DeadAndExit = reapAndGetExitCode(Handle, false);
  if (!DeadAndExit.first)
    return false;

  Dead = true;
  ExitCode = DeadAndExit.second;
  return true;
}

void Process::wait()
{
  if (Dead)
    return;

  PIDSET_TRACE_LOG(LOG(trace) << "Waiting for child PID " << Handle);
  std::pair<bool, int> DeadAndExit = reapAndGetExitCode(Handle, true);
  Dead = true;
  ExitCode = DeadAndExit.second;
}

// NOLINTNEXTLINE(readability-make-member-function-const)
void Process::signal(int Signal)
{
  if (Dead)
    return;
  system::Process::signal(Handle, Signal);
}

} // namespace unix

void Process::signal(Raw Handle, int Signal)
{
  if (Handle == ProcessTraits<CurrentPlatform>::Invalid)
    return;

  PIDSET_TRACE_LOG(LOG(trace)
                   << "Sending signal " << Signal << " to PID " << Handle);
  auto Kill = CheckedErrno(
    [PGroup = -Handle, Signal] { return ::kill(PGroup, Signal); }, -1);
  if (!Kill)
    LOG(warn) << "Failed to send signal " << Signal << " to process group "
              << Handle << ": " << Kill.getError().message();
}

} // namespace pidset::system

#undef LOG
