/* SPDX-License-Identifier: GPL-3.0-only */
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <getopt.h>
#include <unistd.h>

#include "pidset/Config.h"
#include "pidset/FrontendExitCode.hpp"
#include "pidset/PidSet.hpp"
#include "pidset/PidSetError.hpp"
#include "pidset/Supervisor.hpp"
#include "pidset/Version.hpp"
#include "pidset/unreachable.hpp"

#include "Config.hpp"

#include "pidset/Log.hpp"
#define LOG(SEVERITY) pidset::log::SEVERITY("main")

namespace
{

const char ShortOptions[] = "hvqVaAn:c:";

// clang-format off
struct ::option LongOptions[] = {
  {"help",    no_argument,       nullptr, 'h'},
  {"verbose", no_argument,       nullptr, 'v'},
  {"quiet",   no_argument,       nullptr, 'q'},
  {"version", no_argument,       nullptr, 'V'},
  {"any",     no_argument,       nullptr, 'a'},
  {"all",     no_argument,       nullptr, 'A'},
  {"exits",   required_argument, nullptr, 'n'},
  {"spawn",   required_argument, nullptr, 'c'},
  {nullptr,   0,                 nullptr, 0}
};
// clang-format on

enum class WaitMode
{
  Any,
  All,
  Count
};

struct MainOptions
{
  /// \p -h
  bool ShowHelp : 1;

  /// \p -V
  bool ShowVersion : 1;

  /// \p -V a second time
  bool ShowElaborateBuildInformation : 1;

  /// \p -v
  bool AnyVerboseFlag : 1;
  /// \p -q
  bool AnyQuietFlag : 1;

  /// Whether any of \p -a, \p -A, or \p -n was given.
  bool AnyWaitModeFlag : 1;

  /// \p -v or \p -q sequences
  std::int8_t VerbosityQuietnessDifferential = 0;

  /// \p -v and \p -q translated to \p Severity choice.
  pidset::log::Severity Severity;

  /// \p -a, \p -A, or \p -n
  WaitMode Mode;
  /// \p -n N
  std::size_t ExitCount;

  /// \p -c COUNT
  std::size_t SpawnCount;

  /// The PIDs to monitor, if nothing is spawned.
  std::vector<pidset::PidSet::PID> PIDs;
  /// The program to spawn \p SpawnCount copies of.
  pidset::system::Process::SpawnOptions Program;
};

void printHelp();
void printVersion();
void printFeatures();
std::pair<bool, MainOptions> argParse(int ArgC, const char* const ArgV[]);
std::size_t waitAccordingTo(const MainOptions& Opts,
                            std::size_t Tracked,
                            pidset::PidSet* Monitor,
                            pidset::RunningSupervisor* Supervisor);
void printOutcome(std::size_t Exited,
                  const std::vector<pidset::PidSet::PID>& Running);

/// Parses \p Str as a non-negative decimal number.
std::optional<unsigned long long> parseNumber(const char* Str)
{
  if (!Str || *Str == '\0' || *Str == '-' || *Str == '+')
    return std::nullopt;

  char* End = nullptr;
  errno = 0;
  unsigned long long Value = std::strtoull(Str, &End, 10);
  if (errno != 0 || *End != '\0')
    return std::nullopt;
  return Value;
}

} // namespace

int main(int ArgC, char* ArgV[])
{
  using namespace pidset;

  // ------------------------ Parse command-line options -----------------------
  bool ParseErrors = false;
  MainOptions MainOpts{};
  std::tie(ParseErrors, MainOpts) = argParse(ArgC, ArgV);

  // ---------------------- Perform simple tasks and exit ----------------------
  if (MainOpts.ShowHelp)
  {
    printHelp();
    return static_cast<int>(FrontendExitCode::Success);
  }
  if (MainOpts.ShowVersion)
  {
    printVersion();
    if (MainOpts.ShowElaborateBuildInformation)
      printFeatures();
    return static_cast<int>(FrontendExitCode::Success);
  }
  if (ParseErrors)
    return static_cast<int>(FrontendExitCode::InvocationError);

  // ------------------- Initialise the core helper libraries ------------------
  log::Logger::get().setLimit(MainOpts.Severity);

  // ---------------------------- Wait for the exits ---------------------------
  try
  {
    if (MainOpts.SpawnCount)
    {
      CommandSupervisor Group;
      for (std::size_t I = 0; I < MainOpts.SpawnCount; ++I)
        Group.add(MainOpts.Program);

      RunningSupervisor Running = std::move(Group).spawn();
      std::size_t Exited = waitAccordingTo(
        MainOpts, Running.pids().size(), nullptr, &Running);
      printOutcome(Exited, Running.running());
      Running.close();
      return static_cast<int>(FrontendExitCode::Success);
    }

    PidSet Monitor(MainOpts.PIDs);
    std::size_t Exited =
      waitAccordingTo(MainOpts, Monitor.size(), &Monitor, nullptr);
    printOutcome(Exited, Monitor.pids());
    Monitor.close();
    return static_cast<int>(FrontendExitCode::Success);
  }
  catch (const PidSetError& E)
  {
    if (E.kind() == PidSetErrc::WaitCountExceedsTracked)
    {
      std::cerr << ArgV[0] << ": " << E.what() << std::endl;
      return static_cast<int>(FrontendExitCode::InvocationError);
    }

    LOG(fatal) << E.what();
    if (auto PID = E.pid())
      LOG(fatal) << "    PID: " << *PID;
    return static_cast<int>(FrontendExitCode::SystemError);
  }
  catch (const std::system_error& E)
  {
    LOG(fatal) << E.what();
    return static_cast<int>(FrontendExitCode::SystemError);
  }
}

namespace
{

void printHelp()
{
  std::cout << R"EOF(Usage:
    pidset [-vq...] [-a|-A|-n N] PID...
    pidset [-vq...] [-a|-A|-n N] -c COUNT -- PROGRAM [ARGS...]
    pidset (-V[V])

                     PidSet -- Process Exit Monitor

PidSet blocks until some or all of a set of processes terminate. The processes
do not need to be children of PidSet: each of them is watched through a
process file descriptor, so the exit of any process the user may inspect can
be observed.

After the wait, the number of observed exits and the PIDs of the processes
still running are printed to the standard output.

Options:
    -V[V], --version            - Show version information about the executable.
                                  If repeated, elaborate build configuration,
                                  such as features, too.
    -v, --verbose               - Increase the verbosity of the built-in logging
                                  mechanism. Each '-v' supplied enables one more
                                  level. (Meaningless together with '-q'.)
    -q, --quiet                 - Decrease the verbosity of the built-in logging
                                  mechanism. Each '-q' supplied disables one
                                  more level. (Meaningless together with '-v'.)


Wait options:
    -a, --any                   - Wait until at least one of the processes
                                  exits. (This is the default.)
    -A, --all                   - Wait until every process exits.
    -n N, --exits N             - Wait until at least N of the processes exit.
                                  N must not be more than the number of
                                  distinct processes.


Process options:
    PID...                      - The process identifiers to monitor. Every
                                  process must exist when PidSet starts.
    -c COUNT, --spawn COUNT     - Instead of monitoring existing processes,
                                  start COUNT copies of PROGRAM (with ARGS...
                                  given as its command-line arguments) and
                                  monitor those. Copies still running when
                                  PidSet exits are NOT killed.

                                  If the arguments to be passed to the started
                                  program start with '-' or '--', the program
                                  invocation and PidSet's arguments must be
                                  separated by an explicit '--':

                                      pidset -A -c 4 -- /bin/sh -c 'sleep 1'
)EOF";
  std::cout << std::endl;
}

void printVersion()
{
  std::cout << "PidSet version " << pidset::getShortVersion() << std::endl;
}

void printFeatures()
{
  std::cout << "Configuration:\n"
            << pidset::getHumanReadableConfiguration() << std::endl;
}

std::pair<bool, MainOptions> argParse(int ArgC, const char* const ArgV[])
{
  MainOptions MainOpts{};
  MainOpts.Mode = WaitMode::Any;
  bool HadErrors = false;
  auto ArgError = [&HadErrors, Prog = ArgV[0]]() -> std::ostream& {
    std::cerr << Prog << ": ";
    HadErrors = true;
    return std::cerr;
  };
  auto SetMode = [&MainOpts, &ArgError](WaitMode M, std::string_view Flag) {
    if (MainOpts.AnyWaitModeFlag && MainOpts.Mode != M)
    {
      ArgError() << "option '" << Flag
                 << "' conflicts with an earlier '-a', '-A', or '-n'\n";
      return;
    }
    MainOpts.AnyWaitModeFlag = true;
    MainOpts.Mode = M;
  };

  int Opt;
  int LongOptIndex;
  while ((Opt = ::getopt_long(ArgC,
                              const_cast<char**>(ArgV),
                              ShortOptions,
                              LongOptions,
                              &LongOptIndex)) != -1)
  {
    switch (Opt)
    {
      case '?':
        HadErrors = true;
        break;
      case 'h':
        MainOpts.ShowHelp = true;
        break;
      case 'v':
        if (MainOpts.AnyQuietFlag)
        {
          ArgError() << "option '"
                     << "-v/--verbose"
                     << "' meaningless if '-q/--quiet' was also supplied\n";
          break;
        }
        MainOpts.AnyVerboseFlag = true;
        ++MainOpts.VerbosityQuietnessDifferential;
        break;
      case 'q':
        if (MainOpts.AnyVerboseFlag)
        {
          ArgError() << "option '"
                     << "-q/--quiet"
                     << "' meaningless if '-v/--verbose' was also supplied\n";
          break;
        }
        MainOpts.AnyQuietFlag = true;
        --MainOpts.VerbosityQuietnessDifferential;
        break;
      case 'V':
        if (!MainOpts.ShowVersion)
        {
          MainOpts.ShowVersion = true;
          break;
        }
        if (!MainOpts.ShowElaborateBuildInformation)
        {
          MainOpts.ShowElaborateBuildInformation = true;
          break;
        }
        ArgError() << "option '"
                   << "-V"
                   << "' cannot be repeated this many times\n";
        break;
      case 'a':
        SetMode(WaitMode::Any, "-a/--any");
        break;
      case 'A':
        SetMode(WaitMode::All, "-A/--all");
        break;
      case 'n':
      {
        std::optional<unsigned long long> N = parseNumber(optarg);
        if (!N)
        {
          ArgError() << "option '"
                     << "-n/--exits"
                     << "' expects a non-negative number, got '" << optarg
                     << "'\n";
          break;
        }
        SetMode(WaitMode::Count, "-n/--exits");
        MainOpts.ExitCount = *N;
        break;
      }
      case 'c':
      {
        std::optional<unsigned long long> N = parseNumber(optarg);
        if (!N || *N == 0)
        {
          ArgError() << "option '"
                     << "-c/--spawn"
                     << "' expects a positive number, got '" << optarg
                     << "'\n";
          break;
        }
        MainOpts.SpawnCount = *N;
        break;
      }
      default:
        std::cerr << ArgV[0] << ": "
                  << "option '" << '-' << static_cast<char>(Opt)
                  << "' is registered to be accepted, but the associated "
                     "handler is not found\n\tThe flag will be ignored! Please "
                     "report this as a bug!\n";
        break;
    }
  }

  {
    using namespace pidset::log;

#if PIDSET_NON_ESSENTIAL_LOGS
    std::size_t VerbosityPositiveSizeT =
      std::abs(MainOpts.VerbosityQuietnessDifferential);
#endif
    if (MainOpts.VerbosityQuietnessDifferential > MaximumVerbosity)
    {
      PIDSET_TRACE_LOG(
        std::cerr << "Warning: Requested logging verbosity '-"
                  << (std::string(VerbosityPositiveSizeT, 'v'))
                  << "' larger than possible, clamping to available maximum."
                  << std::endl);
      MainOpts.VerbosityQuietnessDifferential = MaximumVerbosity;
    }
    else if (MainOpts.VerbosityQuietnessDifferential < -MinimumVerbosity)
    {
      PIDSET_TRACE_LOG(
        std::cerr << "Warning: Requested logging verbosity '-"
                  << (std::string(VerbosityPositiveSizeT, 'q'))
                  << "' larger than possible, clamping to available maximum."
                  << std::endl);
      MainOpts.VerbosityQuietnessDifferential = -MinimumVerbosity;
    }
    MainOpts.Severity =
      static_cast<Severity>(Default + MainOpts.VerbosityQuietnessDifferential);
  }

  // Handle positional arguments not handled earlier.
  for (; ::optind < ArgC; ++::optind)
  {
    if (MainOpts.SpawnCount)
    {
      if (MainOpts.Program.Program.empty())
        // The first positional argument is the program name to spawn.
        MainOpts.Program.Program = ArgV[::optind];
      else
        // Otherwise they are arguments to the program to start.
        MainOpts.Program.Arguments.emplace_back(ArgV[::optind]);
      continue;
    }

    std::optional<unsigned long long> PID = parseNumber(ArgV[::optind]);
    if (!PID || *PID == 0 ||
        *PID > static_cast<unsigned long long>(
                 std::numeric_limits<pidset::PidSet::PID>::max()))
    {
      ArgError() << "'" << ArgV[::optind] << "' is not a valid PID\n";
      continue;
    }
    MainOpts.PIDs.emplace_back(static_cast<pidset::PidSet::PID>(*PID));
  }

  if (!MainOpts.ShowHelp && !MainOpts.ShowVersion)
  {
    if (MainOpts.SpawnCount && MainOpts.Program.Program.empty())
      ArgError() << "option '"
                 << "-c/--spawn"
                 << "' requires a PROGRAM to start\n";
    else if (!MainOpts.SpawnCount && MainOpts.PIDs.empty())
      ArgError() << "no PIDs given to monitor\n";
  }

  return std::make_pair(HadErrors, std::move(MainOpts));
}

std::size_t waitAccordingTo(const MainOptions& Opts,
                            std::size_t Tracked,
                            pidset::PidSet* Monitor,
                            pidset::RunningSupervisor* Supervisor)
{
  LOG(debug) << "Monitoring " << Tracked << " processes";
  switch (Opts.Mode)
  {
    case WaitMode::Any:
      return Monitor ? Monitor->waitAny() : Supervisor->waitAny();
    case WaitMode::All:
      return Monitor ? Monitor->waitAll() : Supervisor->waitAll();
    case WaitMode::Count:
      return Monitor ? Monitor->waitN(Opts.ExitCount)
                     : Supervisor->waitN(Opts.ExitCount);
  }
  unreachable("Unknown WaitMode");
}

void printOutcome(std::size_t Exited,
                  const std::vector<pidset::PidSet::PID>& Running)
{
  std::cout << "exited: " << Exited << '\n';
  std::cout << "running:";
  for (pidset::PidSet::PID P : Running)
    std::cout << ' ' << P;
  std::cout << std::endl;
}

} // namespace

#undef LOG
