/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include "pidset/system/CurrentPlatform.hpp"
#include "pidset/system/HandleTraits.hpp"

namespace pidset::system
{

using PlatformSpecificHandleTraits = HandleTraits<CurrentPlatform>;

/// Owns an OS-level resource (a file descriptor on Unix) and releases it
/// when the owner goes out of scope.
///
/// The class is deliberately non-polymorphic so that platform-specific
/// refinements (such as \p unix::fd) may be sliced into a \p Handle freely.
class Handle
{
public:
  using Raw = PlatformSpecificHandleTraits::RawTy;

protected:
  Raw Value;

  Handle(Raw Value) noexcept : Value(Value) {}

public:
  /// Creates a handle that owns nothing.
  Handle() noexcept : Value(PlatformSpecificHandleTraits::Invalid) {}

  /// Takes ownership of the already opened resource \p Value.
  [[nodiscard]] static Handle wrap(Raw Value) noexcept { return {Value}; }

  Handle(const Handle&) = delete;
  Handle& operator=(const Handle&) = delete;

  Handle(Handle&& RHS) noexcept : Value(RHS.release()) {}
  Handle& operator=(Handle&& RHS) noexcept
  {
    if (this != &RHS)
    {
      reset();
      Value = RHS.release();
    }
    return *this;
  }

  ~Handle() noexcept { reset(); }

  /// Releases the owned resource, ignoring errors, and leaves the handle
  /// empty.
  void reset() noexcept
  {
    if (has())
      PlatformSpecificHandleTraits::close(release());
  }

  [[nodiscard]] bool has() const noexcept { return isValid(Value); }
  [[nodiscard]] static bool isValid(Raw Value) noexcept
  {
    return Value != PlatformSpecificHandleTraits::Invalid;
  }

  operator Raw() const noexcept { return Value; }
  [[nodiscard]] Raw get() const noexcept { return Value; }

  /// Gives up ownership without closing the resource.
  [[nodiscard]] Raw release() noexcept
  {
    Raw R = Value;
    Value = PlatformSpecificHandleTraits::Invalid;
    return R;
  }
};

} // namespace pidset::system
