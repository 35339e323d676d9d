/* SPDX-License-Identifier: GPL-3.0-only */
#pragma once

namespace pidset
{

/// Contains the exit codes the \p pidset executable returns with.
enum class FrontendExitCode : int
{
  /// Successful execution (the requested number of exits was observed).
  Success = 0,

  /// Indicates a failure of the operating system facilities used in
  /// monitoring.
  SystemError = 1,

  /// Values specified on the command-line are erroneous.
  InvocationError = 2,
};

} // namespace pidset
