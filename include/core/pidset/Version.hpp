/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cstddef>
#include <string>

namespace pidset
{

struct Version
{
  std::size_t Major, Minor, Patch, Tweak;
};

/// \returns the version the library was configured with.
[[nodiscard]] Version getVersion() noexcept;

/// \returns \p Major.Minor.Patch, followed by \p .Tweak only if it is set.
[[nodiscard]] std::string getShortVersion();

} // namespace pidset
