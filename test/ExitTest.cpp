/**
 * Copyright (C) 2022 Whisperity
 *
 * SPDX-License-Identifier: GPL-3.0
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include <iostream>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <system_error>
#include <utility>

#include <gtest/gtest.h>

#include "procexit/Bash.hpp"
#include "procexit/Exit.hpp"
#include "procexit/IOErrorKind.hpp"
#include "procexit/Log.hpp"
#include "procexit/Sysexits.hpp"

// NOLINTBEGIN(cert-err58-cpp)

using namespace procexit;

namespace
{

struct Coordinate
{
  int X, Y;
};

std::ostream& operator<<(std::ostream& OS, const Coordinate& C)
{
  return OS << '(' << C.X << ", " << C.Y << ')';
}

/// A stream buffer that fails every write, like a closed standard error.
class ClosedBuffer : public std::streambuf
{
protected:
  int_type overflow(int_type /* Ch */) override { return traits_type::eof(); }
  std::streamsize xsputn(const char* /* S */, std::streamsize /* N */) override
  {
    return 0;
  }
};

} // namespace

TEST(Exit, NoMessage)
{
  Exit E{Code::Failure};
  EXPECT_EQ(E.code(), Code::Failure);
  EXPECT_FALSE(E.hasMessage());
  EXPECT_EQ(E.message(), "");

  std::ostringstream Buf;
  Buf << E;
  EXPECT_EQ(Buf.str(), "");
}

TEST(Exit, MessageIsReplaced)
{
  Exit E{sysexits::DataErr};
  E.withMessage("first");
  EXPECT_EQ(E.message(), "first");
  E.withMessage(std::string{"second"});
  EXPECT_EQ(E.message(), "second");
  EXPECT_EQ(E.code(), sysexits::DataErr);
}

TEST(Exit, MessageIsOwned)
{
  char Buffer[] = "original";
  Exit E = Exit{Code::Failure}.withMessage(Buffer);
  Buffer[0] = 'X';
  EXPECT_EQ(E.message(), "original");
}

TEST(Exit, DisplayableMessages)
{
  EXPECT_EQ(Exit{Code::Failure}.withMessage(Coordinate{1, 2}).message(),
            "(1, 2)");
  EXPECT_EQ(
    Exit{Code::Failure}.withMessage(std::runtime_error{"bad thing"}).message(),
    "bad thing");
  EXPECT_EQ(Exit{Code::Failure}
              .withMessage(std::make_error_code(std::errc::broken_pipe))
              .message(),
            std::make_error_code(std::errc::broken_pipe).message());
  EXPECT_EQ(Exit{Code::Failure}.withMessage(42).message(), "42");
}

TEST(Exit, Printing)
{
  std::ostringstream Buf;
  Buf << Exit{Code{3}}.withMessage("three");
  EXPECT_EQ(Buf.str(), "three");
}

TEST(Exit, WithCode)
{
  Exit E = Exit::withCode(std::invalid_argument{"--frobnicate"},
                          sysexits::UsageErr);
  EXPECT_EQ(E.code(), sysexits::UsageErr);
  EXPECT_EQ(E.message(), "--frobnicate");
}

TEST(Exit, FromIOErrorCode)
{
  std::error_code EC = std::make_error_code(std::errc::permission_denied);
  Exit E = Exit::fromIOError(EC);
  EXPECT_EQ(E.code(), sysexits::NoPerm);
  EXPECT_EQ(E.message(), EC.message());

  EXPECT_EQ(
    Exit::fromIOError(std::make_error_code(std::errc::broken_pipe)).code(),
    bash::SigPIPE);
  EXPECT_EQ(Exit::fromIOError(make_error_code(IOErrorKind::Other)).code(),
            Code::Failure);
  EXPECT_EQ(Exit::fromIOError(std::make_error_code(std::errc::io_error)).code(),
            sysexits::IOErr);
}

TEST(Exit, FromSystemError)
{
  std::system_error Err{std::make_error_code(std::errc::no_such_file_or_directory),
                        "open(\"config.ini\")"};
  Exit E = Exit::fromIOError(Err);
  EXPECT_EQ(E.code(), sysexits::OSFileErr);
  EXPECT_EQ(E.message(), Err.what());
}

TEST(ExitResult, SuccessAndFailure)
{
  ExitResult Ok;
  EXPECT_TRUE(Ok);
  EXPECT_TRUE(Ok.isSuccess());
  EXPECT_TRUE(ExitResult::success());

  ExitResult Err = Exit{sysexits::TempFail}.withMessage("later");
  ASSERT_FALSE(Err);
  EXPECT_EQ(Err.getError().code(), sysexits::TempFail);

  Exit E = std::move(Err).takeError();
  EXPECT_EQ(E.code(), sysexits::TempFail);
  EXPECT_EQ(E.message(), "later");
}

TEST(Report, Success)
{
  std::ostringstream Buf;
  EXPECT_EQ(report(ExitResult::success(), Buf), Code::Success);
  EXPECT_EQ(Buf.str(), "");
}

TEST(Report, FailureWithMessage)
{
  std::ostringstream Buf;
  EXPECT_EQ(report(Exit{Code::Failure}.withMessage("boom"), Buf),
            Code::Failure);
  EXPECT_EQ(Buf.str(), "boom\n");
}

TEST(Report, FailureWithoutMessage)
{
  std::ostringstream Buf;
  EXPECT_EQ(report(Exit{Code::Failure}, Buf), Code::Failure);
  EXPECT_EQ(Buf.str(), "");
}

TEST(Report, KeepsOutOfRangeCode)
{
  std::ostringstream Buf;
  EXPECT_EQ(report(Code{1000}.ok(), Buf).raw(), 1000);
}

TEST(Report, ToStandardError)
{
  ::testing::internal::CaptureStderr();
  Code C = report(Exit{sysexits::NoHost}.withMessage("no such host"));
  std::string Output = ::testing::internal::GetCapturedStderr();

  EXPECT_EQ(C, sysexits::NoHost);
  EXPECT_EQ(Output, "no such host\n");
}

TEST(Report, NoDiagnosticsAtDebugSeverity)
{
  log::Logger& L = log::Logger::get();
  log::Severity OldLimit = L.getLimit();
  std::ostringstream LogBuf;
  L.setLimit(log::Debug);
  L.setOutput(LogBuf);

  std::ostringstream Buf;
  Code C = report(Exit{sysexits::SoftwareErr}.withMessage("boom"), Buf);

  L.setOutput(std::clog);
  L.setLimit(OldLimit);

  EXPECT_EQ(C, sysexits::SoftwareErr);
  EXPECT_EQ(Buf.str(), "boom\n");
  EXPECT_EQ(LogBuf.str(), "");
}

TEST(Report, ClosedStreamIsIgnored)
{
  ClosedBuffer Closed;
  std::ostream OS{&Closed};
  EXPECT_EQ(report(Exit{Code::Failure}.withMessage("lost"), OS),
            Code::Failure);
  EXPECT_TRUE(OS.bad());
}

TEST(Report, ThrowingStreamIsIgnored)
{
  ClosedBuffer Closed;
  std::ostream OS{&Closed};
  OS.exceptions(std::ios::badbit | std::ios::failbit);

  Code C = Code::Success;
  EXPECT_NO_THROW(C = report(Exit{sysexits::IOErr}.withMessage("lost"), OS));
  EXPECT_EQ(C, sysexits::IOErr);
}

TEST(ExitDeathTest, ExitSuccess)
{
  EXPECT_EXIT(procexit::exit(ExitResult::success()),
              ::testing::ExitedWithCode(0),
              "");
}

TEST(ExitDeathTest, PermissionDenied)
{
  EXPECT_EXIT(procexit::exit(Exit::fromIOError(
                std::make_error_code(std::errc::permission_denied))),
              ::testing::ExitedWithCode(77),
              std::make_error_code(std::errc::permission_denied).message());
}

TEST(ExitDeathTest, BrokenPipe)
{
  EXPECT_EXIT(procexit::exit(Exit::fromIOError(
                std::make_error_code(std::errc::broken_pipe))),
              ::testing::ExitedWithCode(141),
              "");
}

TEST(ExitDeathTest, OutOfRangeCode)
{
  EXPECT_EXIT(procexit::exit(Exit{Code{1000}}.withMessage("too large")),
              ::testing::ExitedWithCode(1),
              "too large");
}

TEST(ExitDeathTest, SuccessIsNotAnError)
{
  // Without assertions, the error still never reports success.
  EXPECT_DEBUG_DEATH(
    {
      std::ostringstream Buf;
      Exit E{Code::Success};
      EXPECT_EQ(E.code(), Code::Default);
      EXPECT_EQ(report(std::move(E).withMessage("oops"), Buf), Code::Default);
      EXPECT_EQ(Buf.str(), "oops\n");
    },
    "successful code");
}

// NOLINTEND(cert-err58-cpp)
