/* SPDX-License-Identifier: LGPL-3.0-only */
#include <csignal>
#include <system_error>

#include "pidset/adt/scope_guard.hpp"

#include "pidset/Supervisor.hpp"

#include "pidset/Log.hpp"
#define LOG(SEVERITY) pidset::log::SEVERITY("Supervisor")

namespace pidset
{

namespace
{

std::vector<PidSet::PID>
pidsOf(const std::vector<std::unique_ptr<system::Process>>& Children)
{
  std::vector<PidSet::PID> R;
  R.reserve(Children.size());
  for (const auto& C : Children)
    R.emplace_back(C->raw());
  return R;
}

} // namespace

CommandSupervisor::CommandSupervisor(std::vector<Command> Commands)
  : Commands(std::move(Commands))
{}

CommandSupervisor& CommandSupervisor::add(Command C)
{
  Commands.emplace_back(std::move(C));
  return *this;
}

RunningSupervisor CommandSupervisor::spawn() &&
{
  return std::move(*this).spawn(system::ExitEventSource::createDefault());
}

RunningSupervisor
CommandSupervisor::spawn(std::unique_ptr<system::ExitEventSource> Backend) &&
{
  std::vector<std::unique_ptr<system::Process>> Children;
  Children.reserve(Commands.size());
  try
  {
    for (const Command& C : Commands)
      Children.emplace_back(system::Process::spawn(C));
  }
  catch (const std::system_error& E)
  {
    LOG(error) << "Starting command #" << Children.size() + 1
               << " failed: " << E.what();
    for (auto& C : Children)
    {
      C->signal(SIGKILL);
      C->wait();
    }
    throw;
  }

  LOG(debug) << "Started " << Children.size() << " commands";
  Commands.clear();
  return RunningSupervisor{std::move(Children), std::move(Backend)};
}

RunningSupervisor::RunningSupervisor(
  std::vector<std::unique_ptr<system::Process>> Children,
  std::unique_ptr<system::ExitEventSource> Backend)
  : Children(std::move(Children)),
    Monitor(pidsOf(this->Children), std::move(Backend))
{}

std::vector<RunningSupervisor::PID> RunningSupervisor::pids() const
{
  return pidsOf(Children);
}

std::size_t RunningSupervisor::waitAny()
{
  scope_guard Reap{[this]() noexcept { reapObserved(); }};
  return Monitor.waitAny();
}

std::size_t RunningSupervisor::waitN(std::size_t N)
{
  scope_guard Reap{[this]() noexcept { reapObserved(); }};
  return Monitor.waitN(N);
}

std::size_t RunningSupervisor::waitAll()
{
  scope_guard Reap{[this]() noexcept { reapObserved(); }};
  return Monitor.waitAll();
}

void RunningSupervisor::close() { Monitor.close(); }

void RunningSupervisor::reapObserved() noexcept
{
  for (auto& C : Children)
  {
    if (C->dead() || Monitor.contains(C->raw()))
      continue;
    try
    {
      if (!C->reapIfDead())
        LOG(warn) << "PID " << C->raw() << " exited, but could not be reaped";
    }
    catch (const std::system_error& E)
    {
      LOG(error) << "Reaping PID " << C->raw() << " failed: " << E.what();
    }
  }
}

} // namespace pidset

#undef LOG
