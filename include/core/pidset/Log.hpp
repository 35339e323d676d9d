/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

#include "pidset/Config.h"
#include "pidset/Debug.h"

namespace pidset::log
{

/// How important a log message is. A smaller number is more important, and
/// the logger prints every message up to (and including) its limit.
enum Severity
{
  /// Printed unconditionally, even at the quietest setting.
  None = 0,
  /// The program cannot continue.
  Fatal,
  /// An operation failed and its result is lost.
  Error,
  /// Something went wrong but the operation could carry on.
  Warning,
  Info,
  /// Process and descriptor lifecycle: registrations, exits, spawns.
  Debug,
  /// Every readiness event and every wait cycle.
  Trace,
  /// The lifetime of each raw file descriptor.
  Data,

  Default = Info,
  Max = None,
  Min = Data,
};

/// How many steps \p -v may raise the limit from \p Default.
constexpr std::int8_t MaximumVerbosity = log::Min - log::Default;
/// How many steps \p -q may lower the limit from \p Default.
constexpr std::int8_t MinimumVerbosity = log::Default - log::Max - 1;

/// Writes line-oriented, timestamped log messages to an output stream.
/// Messages above the configured severity limit cost nothing but the
/// evaluation of their arguments.
///
/// \note Not thread-safe.
class Logger
{
  /// Collects one message and flushes it as a single line when destroyed.
  class Record
  {
    std::ostream* OS;
    std::ostringstream Line;
    bool Enabled;

  public:
    Record(std::ostream& OS, bool Enabled, std::string_view Prefix);
    Record(const Record&) = delete;
    Record(Record&&) = delete;
    ~Record() noexcept(false);

    template <typename T> Record& operator<<(T&& Value)
    {
      if (Enabled)
        Line << std::forward<T>(Value);
      return *this;
    }
  };

  static std::unique_ptr<Logger> Global;

public:
  /// \returns the fixed-width tag printed for \p S.
  static const char* levelName(Severity S) noexcept;

  /// \returns the process-wide logger, created on first use with the
  /// \p Default limit, writing to \p std::clog.
  static Logger& get();

  /// Creates a stand-alone logger, unrelated to \p get().
  Logger(Severity SeverityLimit, std::ostream& OS);

  Severity getLimit() const noexcept { return SeverityLimit; }
  void setLimit(Severity Limit) noexcept { SeverityLimit = Limit; }
  bool enabled(Severity S) const noexcept { return S <= SeverityLimit; }

  void setOutput(std::ostream& OS) noexcept { this->OS = &OS; }

  /// Begins a message of severity \p S, attributed to \p Facility.
  Record operator()(Severity S, std::string_view Facility);

private:
  Severity SeverityLimit;
  std::ostream* OS;
};

#define PIDSET_LOGGER_SHORTCUT(NAME, SEVERITY)                                 \
  inline decltype(auto) NAME(std::string_view Facility)                        \
  {                                                                            \
    return pidset::log::Logger::get()(SEVERITY, Facility);                     \
  }

PIDSET_LOGGER_SHORTCUT(always, None);
PIDSET_LOGGER_SHORTCUT(fatal, Fatal);
PIDSET_LOGGER_SHORTCUT(error, Error);
PIDSET_LOGGER_SHORTCUT(warn, Warning);
PIDSET_LOGGER_SHORTCUT(info, Info);
PIDSET_LOGGER_SHORTCUT(debug, Debug);
PIDSET_LOGGER_SHORTCUT(trace, Trace);
PIDSET_LOGGER_SHORTCUT(data, Data);

#undef PIDSET_LOGGER_SHORTCUT

/* Guards logging code that is only compiled if PIDSET_NON_ESSENTIAL_LOGS is
 * enabled in the build configuration.
 */
#if PIDSET_NON_ESSENTIAL_LOGS
#define PIDSET_TRACE_LOG(X) PIDSET_DETAIL_CONDITIONALLY_TRUE(X)
#else
#define PIDSET_TRACE_LOG(X) PIDSET_DETAIL_CONDITIONALLY_FALSE(X)
#endif

} // namespace pidset::log
