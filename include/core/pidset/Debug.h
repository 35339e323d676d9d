/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once

#define PIDSET_DETAIL_CONDITIONALLY_TRUE(X)                                    \
  do                                                                           \
  {                                                                            \
    X;                                                                         \
  } while (false)
#define PIDSET_DETAIL_CONDITIONALLY_FALSE(X) ((void)0)
