/* SPDX-License-Identifier: LGPL-3.0-only */
#include "pidset/unreachable.hpp"

#include "pidset/PidSetError.hpp"

namespace pidset
{

const char* errcName(PidSetErrc K) noexcept
{
  switch (K)
  {
    case PidSetErrc::MultiplexerCreateFailed:
      return "MultiplexerCreateFailed";
    case PidSetErrc::ProcessLookupFailed:
      return "ProcessLookupFailed";
    case PidSetErrc::AttachFailed:
      return "AttachFailed";
    case PidSetErrc::DetachFailed:
      return "DetachFailed";
    case PidSetErrc::WaitFailed:
      return "WaitFailed";
    case PidSetErrc::UnknownToken:
      return "UnknownToken";
    case PidSetErrc::MultiplexerCloseFailed:
      return "MultiplexerCloseFailed";
    case PidSetErrc::WaitCountExceedsTracked:
      return "WaitCountExceedsTracked";
    case PidSetErrc::UseAfterClose:
      return "UseAfterClose";
  }
  unreachable("Unknown PidSetErrc");
}

PidSetError::PidSetError(PidSetErrc Kind,
                         std::error_code Cause,
                         const std::string& What)
  : std::system_error(Cause, std::string{errcName(Kind)} + ": " + What),
    Kind(Kind)
{}

PidSetError::PidSetError(PidSetErrc Kind,
                         std::error_code Cause,
                         const std::string& What,
                         PID Pid)
  : std::system_error(Cause,
                      std::string{errcName(Kind)} + " for PID " +
                        std::to_string(Pid) + ": " + What),
    Kind(Kind), Pid(Pid)
{}

PidSetError PidSetError::unknownToken(Token T)
{
  PidSetError E{PidSetErrc::UnknownToken,
                std::make_error_code(std::errc::protocol_error),
                "multiplexer reported token " + std::to_string(T) +
                  " that is not tracked"};
  E.Tok = T;
  return E;
}

} // namespace pidset
