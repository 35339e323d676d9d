/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cerrno>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace pidset
{

/// The type of \p errno. It may only be a macro, so it is spelled out.
using errno_t = int;

namespace detail
{

/// A system call's return value paired with the \p errno it left behind.
/// The error code is only meaningful if the result converts to \p false.
template <typename R> class Result
{
  R Value;
  bool Failed;
  std::error_code Error;

public:
  Result(R&& Value, bool Failed, std::error_code Error)
    : Value(std::move(Value)), Failed(Failed), Error(Error)
  {}

  explicit operator bool() const noexcept { return !Failed; }
  std::error_code getError() const noexcept { return Error; }
  R& get() noexcept { return Value; }
  const R& get() const noexcept { return Value; }
};

inline std::error_code errnoToCode(errno_t E) noexcept
{
  return std::make_error_code(static_cast<std::errc>(E));
}

} // namespace detail

/// Runs the system call wrapped in \p F, and captures \p errno if the call
/// returned any of \p FailureValues.
///
///   \code{.cpp}
///   auto PidFD = CheckedErrno(
///     [PID] { return ::syscall(SYS_pidfd_open, PID, 0); }, -1);
///   if (!PidFD)
///     return PidFD.getError();
///   use(PidFD.get());
///   \endcode
template <typename Fn, typename... ErrTys>
decltype(auto)
// NOLINTNEXTLINE(readability-identifier-naming)
CheckedErrno(Fn&& F, ErrTys&&... FailureValues) noexcept
{
  static_assert(!std::is_void_v<decltype(F())>,
                "The wrapped call must return its result!");

  errno = 0;
  auto Value = F();
  const errno_t ErrNo = errno;
  const bool Failed = (false || ... || (Value == FailureValues));
  return detail::Result<decltype(Value)>{
    std::move(Value), Failed, detail::errnoToCode(ErrNo)};
}

/// Like \p CheckedErrno(), but a failure throws \p std::system_error with
/// \p What as its message, and a success returns the call's result.
template <typename Fn, typename... ErrTys>
decltype(auto)
// NOLINTNEXTLINE(readability-identifier-naming)
CheckedErrnoThrow(Fn&& F, const std::string& What, ErrTys&&... FailureValues)
{
  auto R =
    CheckedErrno(std::forward<Fn>(F), std::forward<ErrTys>(FailureValues)...);
  if (!R)
    throw std::system_error{R.getError(), What};

  std::remove_reference_t<decltype(R.get())> Value = R.get();
  return Value;
}

} // namespace pidset
