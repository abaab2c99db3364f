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
#include <sstream>
#include <system_error>

#include <gtest/gtest.h>

#include "procexit/Config.h"
#include "procexit/IOErrorKind.hpp"
#include "procexit/Log.hpp"

// NOLINTBEGIN(cert-err58-cpp)

using namespace procexit;

TEST(Log, SeverityLimit)
{
  std::ostringstream Buf;
  log::Logger L{log::Warning, Buf};

  L(log::Debug, "test") << "hidden";
  EXPECT_EQ(Buf.str(), "");

  L(log::Error, "test") << "shown " << 42;
  std::string Output = Buf.str();
  EXPECT_NE(Output.find("ERROR"), std::string::npos);
  EXPECT_NE(Output.find("test: shown 42"), std::string::npos);
  EXPECT_EQ(Output.back(), '\n');
}

TEST(Log, EmptyFacility)
{
  std::ostringstream Buf;
  log::Logger L{log::Info, Buf};
  L(log::Info, "") << "message";
  EXPECT_NE(Buf.str().find("<Unknown>: message"), std::string::npos);
}

TEST(Log, LevelNames)
{
  EXPECT_STREQ(log::Logger::levelName(log::Fatal), "!!! FATAL  ");
  EXPECT_STREQ(log::Logger::levelName(log::Trace), " >> trace  ");
}

TEST(Log, TraceLogsFollowConfiguration)
{
  log::Logger& L = log::Logger::get();
  log::Severity OldLimit = L.getLimit();
  std::ostringstream Buf;
  L.setLimit(log::Trace);
  L.setOutput(Buf);

  IOErrorKind Kind = classify(std::make_error_code(std::errc::broken_pipe));

  L.setOutput(std::clog);
  L.setLimit(OldLimit);

  EXPECT_EQ(Kind, IOErrorKind::BrokenPipe);
#if PROCEXIT_NON_ESSENTIAL_LOGS
  EXPECT_NE(Buf.str().find("IOErrorKind: "), std::string::npos);
  EXPECT_NE(Buf.str().find(" >> trace  "), std::string::npos);
#else
  EXPECT_EQ(Buf.str(), "");
#endif
}

// NOLINTEND(cert-err58-cpp)
