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

#include "procexit/IOErrorKind.hpp"

#include "procexit/Exit.hpp"

#include "procexit/Log.hpp"
#define LOG(SEVERITY) procexit::log::SEVERITY("Exit")

namespace procexit
{

Exit::Exit(Code C) : C(C.isSuccess() ? Code::Default : C)
{
  assert(C != Code::Success && "Exit error created with a successful code!");
}

std::string Exit::message() const
{
  if (!Msg)
    return {};

  std::ostringstream Buf;
  Msg->display(Buf);
  return Buf.str();
}

Exit Exit::fromIOError(const std::error_code& EC)
{
  Code C = Code::fromIOErrorKind(classify(EC));
  PROCEXIT_TRACE_LOG(LOG(trace) << '"' << EC.message() << "\" -> " << C);
  return Exit{C}.withMessage(EC);
}

Exit Exit::fromIOError(const std::system_error& Err)
{
  Code C = Code::fromIOErrorKind(classify(Err.code()));
  PROCEXIT_TRACE_LOG(LOG(trace) << '"' << Err.what() << "\" -> " << C);
  return Exit{C}.withMessage(Err);
}

std::ostream& operator<<(std::ostream& OS, const Exit& E)
{
  if (E.Msg)
    E.Msg->display(OS);
  return OS;
}

Code report(ExitResult Result) { return report(std::move(Result), std::cerr); }

Code report(ExitResult Result, std::ostream& OS)
{
  if (Result)
  {
    PROCEXIT_TRACE_LOG(LOG(trace) << "Reporting success");
    return Code::Success;
  }

  Exit E = std::move(Result).takeError();
  PROCEXIT_TRACE_LOG(LOG(trace) << "Reporting failure with code " << E.code());
  if (!E.hasMessage())
    return E.code();

  try
  {
    OS << E << '\n';
    OS.flush();
  }
  // Streams with exceptions enabled throw std::ios_base::failure, but some
  // standard libraries throw it with a different ABI than the one visible
  // here.
  catch (const std::exception& Ex)
  {
    PROCEXIT_TRACE_LOG(LOG(trace)
                       << "Failed to print the message: " << Ex.what());
  }
  return E.code();
}

void exit(ExitResult Result)
{
  Code C = report(std::move(Result));
  C.processExit();
}

} // namespace procexit
