/* SPDX-License-Identifier: GPL-3.0-only */
#include <iomanip>
#include <sstream>
#include <string_view>

#include "pidset/Version.hpp"

#include "Config.hpp"

namespace pidset
{

namespace
{

void row(std::ostream& OS, std::string_view Key, std::string_view Value)
{
  OS << "  " << std::left << std::setw(16) << Key << Value << '\n';
}

} // namespace

std::string getHumanReadableConfiguration()
{
  std::ostringstream Buf;
  row(Buf, "Version:", getShortVersion());
  row(Buf, "Build type:", PIDSET_BUILD_TYPE);
  row(Buf, "Platform:", PIDSET_PLATFORM);
  row(Buf, "Exit events:", "pidfd_open(2) + epoll(7)");
  row(Buf, "Library:", config::BuildSharedLibs ? "shared" : "static");
  row(Buf, "Trace logs:", config::NonEssentialLogs ? "compiled" : "stripped");
  return Buf.str();
}

} // namespace pidset
