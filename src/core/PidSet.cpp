/* SPDX-License-Identifier: LGPL-3.0-only */
#include <limits>

#include "pidset/adt/scope_guard.hpp"

#include "pidset/PidSet.hpp"

#include "pidset/Log.hpp"
#define LOG(SEVERITY) pidset::log::SEVERITY("PidSet")

namespace pidset
{

namespace
{

/// The token a process is registered with is its own identifier, which is
/// unique in the set.
PidSet::Token tokenFor(PidSet::PID P) noexcept
{
  return static_cast<PidSet::Token>(P);
}

} // namespace

PidSet::PidSet(std::initializer_list<PID> PIDs)
  : PidSet(PIDs, system::ExitEventSource::createDefault())
{}

PidSet::PidSet(std::initializer_list<PID> PIDs,
               std::unique_ptr<system::ExitEventSource> Backend)
  : Source(std::move(Backend))
{
  for (PID P : PIDs)
    track(P);
}

PidSet::PidSet(PidSet&&) = default;
PidSet& PidSet::operator=(PidSet&&) = default;

PidSet::~PidSet()
{
  if (Multiplexer)
    PIDSET_TRACE_LOG(LOG(trace) << "Dropping without close(), " << size()
                                << " processes still monitored");
}

void PidSet::track(PID P)
{
  if (!Tracked.try_emplace(P).second)
    // FIXME: Callers might expect a separate wait slot for every occurrence.
    LOG(debug) << "PID " << P << " given multiple times, monitored once";
}

std::vector<PidSet::PID> PidSet::pids() const
{
  std::vector<PID> R;
  R.reserve(Tracked.size());
  for (const auto& Entry : Tracked)
    R.emplace_back(Entry.first);
  return R;
}

void PidSet::checkNotClosed() const
{
  if (Closed)
    throw PidSetError{PidSetErrc::UseAfterClose,
                      std::make_error_code(std::errc::bad_file_descriptor),
                      "the monitor was already closed"};
}

void PidSet::initialize() { (void)ensureInitialized(); }

system::ExitMultiplexer& PidSet::ensureInitialized()
{
  checkNotClosed();
  if (Multiplexer)
    return *Multiplexer;

  if (!Source)
    throw PidSetError{PidSetErrc::MultiplexerCreateFailed,
                      std::make_error_code(std::errc::function_not_supported),
                      "no exit event backend for this platform"};

  LOG(debug) << "Registering " << Tracked.size() << " processes...";
  std::unique_ptr<system::ExitMultiplexer> NewMultiplexer =
    Source->createMultiplexer(Tracked.size());

  // Obtain every handle before committing any of them to the multiplexer.
  // If one lookup fails, the ones already opened are closed by RAII.
  std::map<PID, system::ExitHandle> Acquired;
  for (const auto& Entry : Tracked)
    Acquired.try_emplace(Entry.first, Source->acquire(Entry.first));

  std::vector<const system::ExitHandle*> Attached;
  Attached.reserve(Acquired.size());
  scope_guard Rollback{[&NewMultiplexer, &Attached] {
    LOG(debug) << "Registration failed, undoing " << Attached.size()
               << " registrations";
    for (const system::ExitHandle* H : Attached)
    {
      try
      {
        NewMultiplexer->detach(*H);
      }
      catch (const PidSetError& E)
      {
        LOG(warn) << "Undoing registration: " << E.what();
      }
    }
  }};
  for (auto& Entry : Acquired)
  {
    NewMultiplexer->attach(Entry.second, tokenFor(Entry.first));
    Attached.emplace_back(&Entry.second);
  }
  Rollback.release();

  Tracked = std::move(Acquired);
  Multiplexer = std::move(NewMultiplexer);
  LOG(debug) << "Monitoring " << Tracked.size() << " processes";
  return *Multiplexer;
}

std::size_t PidSet::waitAny() { return wait(1); }

std::size_t PidSet::waitN(std::size_t N) { return wait(N); }

std::size_t PidSet::waitAll() { return wait(Tracked.size()); }

std::size_t PidSet::wait(std::size_t N)
{
  checkNotClosed();
  if (N > Tracked.size())
    throw PidSetError{PidSetErrc::WaitCountExceedsTracked,
                      std::make_error_code(std::errc::invalid_argument),
                      "waiting for " + std::to_string(N) +
                        " exits, but only " + std::to_string(Tracked.size()) +
                        " processes are monitored"};

  system::ExitMultiplexer& Mux = ensureInitialized();
  if (N == 0)
    return 0;

  std::size_t Observed = 0;
  while (Observed < N)
  {
    const std::size_t Fired = Mux.wait(Tracked.size());
    PIDSET_TRACE_LOG(LOG(trace) << Fired << " exits fired, " << Observed
                                << '/' << N << " observed before");

    // Every event of the batch must be consumed, even past N, as the
    // multiplexer will not report an already fired process again.
    for (std::size_t I = 0; I < Fired; ++I)
    {
      const Token T = Mux.tokenAt(I);
      auto It = T <= static_cast<Token>(std::numeric_limits<PID>::max())
                  ? Tracked.find(static_cast<PID>(T))
                  : Tracked.end();
      if (It == Tracked.end())
        throw PidSetError::unknownToken(T);

      LOG(debug) << "PID " << It->first << " exited";
      drop(It->second);
      Tracked.erase(It);
      ++Observed;
    }
  }

  return Observed;
}

void PidSet::drop(system::ExitHandle& H)
{
  try
  {
    Multiplexer->detach(H);
  }
  catch (const PidSetError& E)
  {
    // The exit was observed, the entry is removed regardless.
    LOG(warn) << "Exit of PID " << H.pid()
              << " observed, but deregistration failed: " << E.what();
  }
  H.reset();
}

void PidSet::close()
{
  if (Closed)
    return;
  Closed = true;

  if (!Multiplexer)
  {
    LOG(debug) << "Closed before any registration";
    return;
  }

  std::unique_ptr<system::ExitMultiplexer> M = std::move(Multiplexer);
  LOG(debug) << "Closing with " << Tracked.size()
             << " processes still monitored";
  Tracked.clear();
  M->close();
}

} // namespace pidset

#undef LOG
