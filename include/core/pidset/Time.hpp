/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace pidset
{

/// Formats the given \p Chrono \p Time object as a local timestamp with
/// millisecond resolution, e.g. \p 2024-03-01 12:34:56.789.
template <typename T> [[nodiscard]] std::string formatTime(const T& Time)
{
  using namespace std::chrono;
  std::time_t RawTime = T::clock::to_time_t(Time);
  std::tm SplitTime{};
  ::localtime_r(&RawTime, &SplitTime);
  auto Millis =
    duration_cast<milliseconds>(Time.time_since_epoch()).count() % 1000;

  std::ostringstream Buf;
  Buf << std::put_time(&SplitTime, "%Y-%m-%d %H:%M:%S") << '.'
      << std::setw(3) << std::setfill('0') << Millis;
  return Buf.str();
}

} // namespace pidset
