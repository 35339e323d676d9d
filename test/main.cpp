/* SPDX-License-Identifier: GPL-3.0-only */
#include <csignal>
#include <cstring>
#include <iostream>

#include <gtest/gtest.h>

#include "pidset/Log.hpp"

void fatalSignal(int Signal)
{
  // Remove this handler and make the OS handle once we return.
  (void)std::signal(Signal, SIG_DFL);

  std::cerr << "FATAL! " << Signal << ' ' << ::strsignal(Signal) << std::endl;
}

int main(int argc, char *argv[])
{
  ::testing::InitGoogleTest(&argc, argv);

  (void)std::signal(SIGABRT, fatalSignal);
  (void)std::signal(SIGSEGV, fatalSignal);

  // Keep the test output readable, failure paths log warnings on purpose.
  pidset::log::Logger::get().setLimit(pidset::log::Error);

  return RUN_ALL_TESTS();
}
