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
#include "procexit/IOErrorKind.hpp"

#include "procexit/Bash.hpp"

namespace procexit::bash
{

std::optional<Code> fromIOErrorKind(IOErrorKind Kind) noexcept
{
  switch (Kind)
  {
    case IOErrorKind::BrokenPipe:
      return SigPIPE;
    case IOErrorKind::TimedOut:
      return SigALRM;
    case IOErrorKind::Interrupted:
      return SigINT;
    default:
      return std::nullopt;
  }
}

} // namespace procexit::bash
