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
#include <cstdlib>
#include <ostream>

#include "procexit/Bash.hpp"
#include "procexit/Exit.hpp"
#include "procexit/IOErrorKind.hpp"
#include "procexit/Sysexits.hpp"
#include "procexit/system/ProcessStatus.hpp"

#include "procexit/Code.hpp"

#include "procexit/Log.hpp"
#define LOG(SEVERITY) procexit::log::SEVERITY("Code")

namespace procexit
{

bool Code::isReserved() const noexcept
{
  // Every range is checked on its own, values between two ranges are free.
  if (Success.raw() <= Value && Value <= Unknown.raw())
    return true;
  if (sysexits::isSysexit(*this))
    return true;
  if (bash::NotExecutable.raw() <= Value && Value <= bash::InvalidExit.raw())
    return true;
  if (bash::SigHUP.raw() <= Value && Value <= bash::SigTERM.raw())
    return true;
  return *this == bash::StatusOutOfRange;
}

void Code::processExit() const { processExit(Default); }

void Code::processExit(Code Fallback) const
{
  Code Effective = coerce().value_or(Fallback.coerce().value_or(Default));
  if (Effective != *this)
    PROCEXIT_TRACE_LOG(LOG(trace) << "Code " << *this
                                  << " is not portable, exiting with "
                                  << Effective << " instead");
  else
    PROCEXIT_TRACE_LOG(LOG(trace) << "Exiting with code " << Effective);

  std::exit(Effective.raw());
}

Code Code::fromStatus(const system::ProcessStatus& Status)
{
  if (auto Exited = Status.exitStatus())
    return Code{*Exited};
  if (auto Signal = Status.termSignal())
    return fromSignal(*Signal);

  PROCEXIT_TRACE_LOG(LOG(trace) << "Process status \"" << Status
                                << "\" has no code, using default");
  return Default;
}

Code Code::fromIOErrorKind(IOErrorKind Kind) noexcept
{
  if (auto C = sysexits::fromIOErrorKind(Kind))
    return *C;
  if (auto C = bash::fromIOErrorKind(Kind))
    return *C;
  if (Kind == IOErrorKind::Other)
    return Failure;
  return sysexits::IOErr;
}

ExitResult Code::ok() const
{
  if (isSuccess())
    return ExitResult::success();
  return intoExit();
}

Exit Code::intoExit() const { return Exit{*this}; }

std::ostream& operator<<(std::ostream& OS, const Code& C)
{
  return OS << C.raw();
}

} // namespace procexit
