/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cstddef>

namespace pidset::detail
{

/// Reports a broken internal invariant to the standard error stream and
/// aborts the program.
[[noreturn]] void
// NOLINTNEXTLINE(readability-identifier-naming)
unreachable_impl(const char* Msg, const char* File, std::size_t LineNo);

} // namespace pidset::detail

/// Marks a point in the control flow that the program must never reach, such
/// as the fallthrough after a \p switch over every enumerator.
#ifndef NDEBUG
#define unreachable(MSG) ::pidset::detail::unreachable_impl(MSG, __FILE__, __LINE__)
#else
#define unreachable(MSG) ::pidset::detail::unreachable_impl(MSG, nullptr, 0)
#endif
