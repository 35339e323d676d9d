/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <system_error>

#include "pidset/system/Handle.hpp"

namespace pidset::system::unix
{

/// An owning file descriptor, closed when the object dies. It adds checked
/// closing and flag queries to \p Handle, and may be sliced into one.
class fd : public Handle // NOLINT(readability-identifier-naming)
{
public:
  using Traits = HandleTraits<PlatformTag::Unix>;

  using raw_fd = Traits::raw_fd;

  using flag_t = decltype(O_RDONLY);

  fd() noexcept = default;
  fd(raw_fd Value) noexcept;

  /// Closes the owned file descriptor and reports the result of \p close(2),
  /// unlike the destructor which silently ignores errors. The object is empty
  /// afterwards, even if closing failed.
  [[nodiscard]] std::error_code close() noexcept;

  /// \returns whether the given \p Flag, from \p fcntl() descriptor flags,
  /// (e.g. \p FD_CLOEXEC) is set on the file descriptor \p FD.
  [[nodiscard]] static bool hasDescriptorFlag(raw_fd FD, flag_t Flag);
};

static_assert(sizeof(Handle) == sizeof(fd),
              "fd must stay slicable into a Handle");

} // namespace pidset::system::unix
