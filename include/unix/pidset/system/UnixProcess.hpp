/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include "pidset/system/Process.hpp"

namespace pidset::system::unix
{

/// A child process created by \p fork(2) and reaped with \p waitpid(2).
class Process : public system::Process
{
public:
  bool reapIfDead() override;

  void wait() override;

  void signal(int Signal) override;
};

} // namespace pidset::system::unix
