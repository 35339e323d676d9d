/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include "pidset/CheckedErrno.hpp"
#include "pidset/system/CurrentPlatform.hpp"
#include "pidset/system/ProcessTraits.hpp"

namespace pidset
{

/// The kinds of failures the exit monitoring machinery reports.
enum class PidSetErrc
{
  /// The multiplexer (e.g. \p epoll(7) instance) could not be created.
  MultiplexerCreateFailed = 1,
  /// The PID does not name a live process (already exited and reaped, invalid
  /// identifier, or insufficient permissions).
  ProcessLookupFailed,
  /// Registering an exit handle with the multiplexer failed.
  AttachFailed,
  /// Removing an exit handle from the multiplexer failed.
  DetachFailed,
  /// Blocking on the multiplexer failed.
  WaitFailed,
  /// The multiplexer reported a token that is not tracked. This indicates a
  /// broken bookkeeping invariant.
  UnknownToken,
  /// Releasing the multiplexer failed.
  MultiplexerCloseFailed,
  /// More exits were requested than the number of processes still monitored.
  WaitCountExceedsTracked,
  /// The monitor was used after it had been closed.
  UseAfterClose,
};

/// \returns a human-readable name for \p K.
[[nodiscard]] const char* errcName(PidSetErrc K) noexcept;

/// The exception type raised by the exit monitoring machinery.
///
/// \p code() is the underlying cause, usually the \p errno of the failing
/// system call, and \p kind() is the operation that failed.
class PidSetError : public std::system_error
{
public:
  using PID = system::ProcessTraits<system::CurrentPlatform>::RawTy;
  using Token = std::uint64_t;

  PidSetError(PidSetErrc Kind, std::error_code Cause, const std::string& What);

  /// Creates an error that is associated with the process \p Pid.
  PidSetError(PidSetErrc Kind,
              std::error_code Cause,
              const std::string& What,
              PID Pid);

  /// Creates an \p UnknownToken error for \p T.
  [[nodiscard]] static PidSetError unknownToken(Token T);

  [[nodiscard]] PidSetErrc kind() const noexcept { return Kind; }
  /// \returns the PID the failing operation was working on, if any.
  [[nodiscard]] std::optional<PID> pid() const noexcept { return Pid; }
  /// \returns the offending token for \p UnknownToken errors.
  [[nodiscard]] std::optional<Token> token() const noexcept { return Tok; }

private:
  PidSetErrc Kind;
  std::optional<PID> Pid;
  std::optional<Token> Tok;
};

/// Executes a system call like \p CheckedErrnoThrow(), but translates a
/// failure into a \p PidSetError of kind \p K. This is the single point where
/// failing system call return values are mapped to the error taxonomy.
///
/// Example:
///
///   \code{.cpp}
///   CheckedErrnoRaise(PidSetErrc::AttachFailed, [&] {
///     return ::epoll_ctl(EpollFD, EPOLL_CTL_ADD, PidFD, &Event);
///   }, "epoll_ctl(EPOLL_CTL_ADD)", /* ErrorIndicatingReturnValue =*/-1);
///   \endcode
template <typename Fn, typename... ErrTys>
decltype(auto)
// NOLINTNEXTLINE(readability-identifier-naming)
CheckedErrnoRaise(PidSetErrc K,
                  Fn&& F,
                  const std::string& ErrMsg,
                  ErrTys&&... ErrorValues)
{
  auto Result =
    CheckedErrno(std::forward<Fn>(F), std::forward<ErrTys>(ErrorValues)...);
  if (!Result)
    throw PidSetError{K, Result.getError(), ErrMsg};

  std::remove_reference_t<decltype(Result.get())> Copy = Result.get();
  return Copy;
}

/// Same as \p CheckedErrnoRaise(), but the raised error is associated with the
/// process \p Pid.
template <typename Fn, typename... ErrTys>
decltype(auto)
// NOLINTNEXTLINE(readability-identifier-naming)
CheckedErrnoRaiseFor(PidSetErrc K,
                     PidSetError::PID Pid,
                     Fn&& F,
                     const std::string& ErrMsg,
                     ErrTys&&... ErrorValues)
{
  auto Result =
    CheckedErrno(std::forward<Fn>(F), std::forward<ErrTys>(ErrorValues)...);
  if (!Result)
    throw PidSetError{K, Result.getError(), ErrMsg, Pid};

  std::remove_reference_t<decltype(Result.get())> Copy = Result.get();
  return Copy;
}

} // namespace pidset
