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

#include "procexit/Sysexits.hpp"

namespace procexit::sysexits
{

std::optional<Code> fromIOErrorKind(IOErrorKind Kind) noexcept
{
  switch (Kind)
  {
    case IOErrorKind::NotFound:
      return OSFileErr;
    case IOErrorKind::PermissionDenied:
      return NoPerm;
    case IOErrorKind::ConnectionRefused:
    case IOErrorKind::ConnectionReset:
    case IOErrorKind::ConnectionAborted:
    case IOErrorKind::NotConnected:
      return ProtocolErr;
    case IOErrorKind::AddrInUse:
    case IOErrorKind::AddrNotAvailable:
      return ServiceUnavailable;
    case IOErrorKind::AlreadyExists:
      return CantCreat;
    case IOErrorKind::InvalidInput:
    case IOErrorKind::InvalidData:
    case IOErrorKind::UnexpectedEof:
      return DataErr;
    case IOErrorKind::WriteZero:
      return NoInput;
    default:
      return std::nullopt;
  }
}

const char* name(Code C) noexcept
{
  // clang-format off
  static constexpr const char* Names[Max.raw() - Base.raw() + 1] = {
    "EX_USAGE",
    "EX_DATAERR",
    "EX_NOINPUT",
    "EX_NOUSER",
    "EX_NOHOST",
    "EX_UNAVAILABLE",
    "EX_SOFTWARE",
    "EX_OSERR",
    "EX_OSFILE",
    "EX_CANTCREAT",
    "EX_IOERR",
    "EX_TEMPFAIL",
    "EX_PROTOCOL",
    "EX_NOPERM",
    "EX_CONFIG"
  };
  // clang-format on

  if (!isSysexit(C))
    return nullptr;
  return Names[C.raw() - Base.raw()];
}

} // namespace procexit::sysexits
