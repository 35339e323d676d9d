/* SPDX-License-Identifier: GPL-3.0-only */
#include <cerrno>
#include <system_error>

#include <unistd.h>

#include <gtest/gtest.h>

#include "pidset/CheckedErrno.hpp"
#include "pidset/PidSetError.hpp"

/* NOLINTBEGIN(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */

using namespace pidset;

TEST(CheckedErrno, Success)
{
  auto R = CheckedErrno([] { return ::getpid(); }, -1);
  ASSERT_TRUE(R);
  EXPECT_GT(R.get(), 0);
  EXPECT_FALSE(R.getError());
}

TEST(CheckedErrno, Failure)
{
  auto R = CheckedErrno([] { return ::close(-1); }, -1);
  ASSERT_FALSE(R);
  EXPECT_EQ(R.get(), -1);
  EXPECT_EQ(R.getError(), std::errc::bad_file_descriptor);
}

TEST(CheckedErrno, StaleErrnoIsNotReported)
{
  errno = EINVAL;
  auto R = CheckedErrno([] { return 0; }, -1);
  ASSERT_TRUE(R);
  EXPECT_FALSE(R.getError());
}

TEST(CheckedErrno, MultipleErrorValues)
{
  auto R = CheckedErrno(
    [] {
      errno = EAGAIN;
      return 2;
    },
    -1,
    2);
  ASSERT_FALSE(R);
  EXPECT_EQ(R.getError(), std::errc::resource_unavailable_try_again);
}

TEST(CheckedErrno, Throw)
{
  EXPECT_EQ(CheckedErrnoThrow([] { return 7; }, "seven", -1), 7);

  try
  {
    CheckedErrnoThrow([] { return ::close(-1); }, "close(-1)", -1);
    FAIL() << "Expected an exception";
  }
  catch (const std::system_error& E)
  {
    EXPECT_EQ(E.code(), std::errc::bad_file_descriptor);
    EXPECT_NE(std::string{E.what()}.find("close(-1)"), std::string::npos);
  }
}

TEST(CheckedErrno, RaiseTypedError)
{
  try
  {
    CheckedErrnoRaise(PidSetErrc::MultiplexerCloseFailed,
                      [] { return ::close(-1); },
                      "close(-1)",
                      -1);
    FAIL() << "Expected an exception";
  }
  catch (const PidSetError& E)
  {
    EXPECT_EQ(E.kind(), PidSetErrc::MultiplexerCloseFailed);
    EXPECT_EQ(E.code(), std::errc::bad_file_descriptor);
    EXPECT_FALSE(E.pid());
    EXPECT_FALSE(E.token());
  }
}

TEST(CheckedErrno, RaiseTypedErrorForProcess)
{
  try
  {
    CheckedErrnoRaiseFor(PidSetErrc::AttachFailed,
                         1234,
                         [] { return ::close(-1); },
                         "close(-1)",
                         -1);
    FAIL() << "Expected an exception";
  }
  catch (const PidSetError& E)
  {
    EXPECT_EQ(E.kind(), PidSetErrc::AttachFailed);
    EXPECT_EQ(E.pid(), 1234);
    EXPECT_NE(std::string{E.what()}.find("1234"), std::string::npos);
    EXPECT_NE(std::string{E.what()}.find("AttachFailed"), std::string::npos);
  }
}

TEST(CheckedErrno, ErrcNames)
{
  EXPECT_STREQ(errcName(PidSetErrc::UseAfterClose), "UseAfterClose");
  EXPECT_STREQ(errcName(PidSetErrc::WaitCountExceedsTracked),
               "WaitCountExceedsTracked");

  PidSetError E = PidSetError::unknownToken(5);
  EXPECT_EQ(E.kind(), PidSetErrc::UnknownToken);
  EXPECT_EQ(E.token(), PidSetError::Token{5});
}

/* NOLINTEND(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */
