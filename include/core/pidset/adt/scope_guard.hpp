/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <utility>

namespace pidset
{

/// A simple scope guard that fires a callback function (usually, a lambda
/// passed to the constructor) when destructed, unless the guard was
/// \p release()d before leaving the scope.
///
/// Example:
///
///   \code{.cpp}
///   scope_guard Rollback{[&] { undoPartialWork(); }};
///   doWorkThatMightThrow();
///   Rollback.release(); // Success, keep the work.
///   \endcode
template <typename ExitFunction> struct scope_guard
{
  // NOLINTNEXTLINE(google-explicit-constructor)
  scope_guard(ExitFunction&& Exit) noexcept
    : Alive(true), Exit(std::forward<ExitFunction>(Exit))
  {}

  ~scope_guard() noexcept(noexcept(Exit()))
  {
    if (Alive)
      Exit();
    Alive = false;
  }

  /// Disarms the guard, the exit callback will not fire.
  void release() noexcept { Alive = false; }

  /// \returns whether the exit callback will fire at the end of the scope.
  [[nodiscard]] bool armed() const noexcept { return Alive; }

  scope_guard() = delete;
  scope_guard(const scope_guard&) = delete;
  scope_guard(scope_guard&&) = delete;
  scope_guard& operator=(const scope_guard&) = delete;
  scope_guard& operator=(scope_guard&&) = delete;

private:
  bool Alive;
  ExitFunction Exit;
};

template <typename ExitFunction>
scope_guard(ExitFunction&&) -> scope_guard<ExitFunction>;

} // namespace pidset
