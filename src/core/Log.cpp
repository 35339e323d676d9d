/* SPDX-License-Identifier: LGPL-3.0-only */
#include <iostream>

#include "pidset/Time.hpp"

#include "pidset/Log.hpp"

namespace pidset::log
{

namespace
{

// clang-format off
constexpr const char* LevelTags[Min + 1] = {
  "     ",
  "FATAL",
  "ERROR",
  "WARN ",
  "info ",
  "debug",
  "trace",
  "data ",
};
// clang-format on

} // namespace

const char* Logger::levelName(Severity S) noexcept
{
  if (S < log::Max || S > log::Min)
    return "?????";
  return LevelTags[S];
}

Logger::Record::Record(std::ostream& OS, bool Enabled, std::string_view Prefix)
  : OS(&OS), Enabled(Enabled)
{
  if (Enabled)
    Line << Prefix;
}

Logger::Record::~Record() noexcept(false)
{
  if (Enabled)
    (*OS) << Line.str() << std::endl;
}

std::unique_ptr<Logger> Logger::Global;

Logger& Logger::get()
{
  if (!Global)
    Global = std::make_unique<Logger>(Default, std::clog);
  return *Global;
}

Logger::Logger(Severity S, std::ostream& OS) : SeverityLimit(S), OS(&OS) {}

Logger::Record Logger::operator()(Severity S, std::string_view Facility)
{
  if (!enabled(S))
    return {*OS, false, {}};

  std::ostringstream Prefix;
  Prefix << formatTime(std::chrono::system_clock::now()) << ' ' << levelName(S)
         << ' ' << (Facility.empty() ? "-" : Facility) << ": ";
  return {*OS, true, Prefix.str()};
}

} // namespace pidset::log
