/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include "pidset/Config.h"

#ifdef PIDSET_PLATFORM_UNIX
#include "pidset/system/UnixProcessTraits.hpp"
#endif /* PIDSET_PLATFORM_UNIX */
