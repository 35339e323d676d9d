/* SPDX-License-Identifier: GPL-3.0-only */
#pragma once
#include <string>

#include "pidset/Config.h"

namespace pidset
{

/// \returns details about the configuration of the current PidSet build in a
/// human-readable format.
std::string getHumanReadableConfiguration();

} // namespace pidset
