/* SPDX-License-Identifier: LGPL-3.0-only */
#include <cstdio>
#include <cstdlib>

#include "pidset/Version.hpp"

#include "pidset/unreachable.hpp"

namespace pidset::detail
{

[[noreturn]] void
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
unreachable_impl(const char* Msg, const char* File, std::size_t LineNo)
{
  /* NOLINTBEGIN(cppcoreguidelines-pro-type-vararg) */
  (void)std::fprintf(stderr,
                     "pidset %s: internal error: %s",
                     getShortVersion().c_str(),
                     Msg ? Msg : "unreachable code reached");
  if (File)
    (void)std::fprintf(stderr, " (%s:%zu)", File, LineNo);
  (void)std::fputc('\n', stderr);
  /* NOLINTEND(cppcoreguidelines-pro-type-vararg) */

  std::abort();
}

} // namespace pidset::detail
