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
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "procexit/CheckedErrno.hpp"
#include "procexit/Sysexits.hpp"

// NOLINTBEGIN(cert-err58-cpp)

using namespace procexit;

static constexpr char MissingFile[] = "/nonexistent/procexit/test/file";

TEST(CheckedErrno, SuccessfulCall)
{
  auto PID = CheckedErrno([] { return ::getpid(); }, -1);
  ASSERT_TRUE(PID);
  EXPECT_GT(PID.get(), 0);
  EXPECT_TRUE(toSysexits(PID));
  EXPECT_TRUE(withCode(PID, sysexits::OSErr));
}

TEST(CheckedErrno, FailedCallToSysexits)
{
  auto Open =
    CheckedErrno([] { return ::open(MissingFile, O_RDONLY); }, -1);
  ASSERT_FALSE(Open);
  EXPECT_EQ(Open.getError(), std::errc::no_such_file_or_directory);

  ExitResult R = toSysexits(Open);
  ASSERT_FALSE(R);
  EXPECT_EQ(R.getError().code(), sysexits::OSFileErr);
  EXPECT_EQ(R.getError().message(),
            std::make_error_code(std::errc::no_such_file_or_directory)
              .message());
}

TEST(CheckedErrno, FailedCallWithCode)
{
  auto Open =
    CheckedErrno([] { return ::open(MissingFile, O_RDONLY); }, -1);
  ExitResult R = withCode(Open, sysexits::NoInput);
  ASSERT_FALSE(R);
  EXPECT_EQ(R.getError().code(), sysexits::NoInput);
}

TEST(CheckedErrno, ComplexCallback)
{
  auto Close = CheckedErrno([](bool& Error) { Error = ::close(-1) == -1; });
  ASSERT_FALSE(Close);
  EXPECT_EQ(Close.getError(), std::errc::bad_file_descriptor);
  EXPECT_EQ(toSysexits(Close).getError().code(), sysexits::IOErr);
}

TEST(CheckedErrno, ThrowConvertsToExit)
{
  try
  {
    (void)CheckedErrnoThrow(
      [] { return ::open(MissingFile, O_RDONLY); }, "open()", -1);
    FAIL() << "open() of a missing file should have thrown";
  }
  catch (const std::system_error& Err)
  {
    Exit E = Exit::fromIOError(Err);
    EXPECT_EQ(E.code(), sysexits::OSFileErr);
    EXPECT_EQ(E.message(), Err.what());
  }
}

// NOLINTEND(cert-err58-cpp)
