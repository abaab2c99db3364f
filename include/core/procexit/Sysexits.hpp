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
#pragma once
#include <optional>

#include "procexit/Code.hpp"

/// Support for the \p sysexits(3) codes, originating from BSD mail handling.
///
/// \note FreeBSD no longer encourages the use of these codes, but they remain
/// the most widespread finer-grained classification of failures.
namespace procexit::sysexits
{

/// The process exited successfully.
constexpr Code Ok{0};

/// The command was used incorrectly, e.g. with the wrong number of arguments,
/// a bad flag, bad syntax in a parameter, or whatever.
constexpr Code UsageErr{64};

/// The input data was incorrect in some way. This should only be used for
/// the user's data and not system files.
constexpr Code DataErr{65};

/// An input file (not a system file) did not exist or was not readable.
constexpr Code NoInput{66};

/// The user specified did not exist. This might be used for mail addresses or
/// remote logins.
constexpr Code NoUser{67};

/// The host specified did not exist. This is used in mail addresses or
/// network requests.
constexpr Code NoHost{68};

/// A service is unavailable. This can occur if a support program or file
/// does not exist. This can also be used as a catch-all message when
/// something you wanted to do does not work, but you do not know why.
constexpr Code ServiceUnavailable{69};

/// An internal software error has been detected. This should be limited to
/// non-operating system related errors if possible.
constexpr Code SoftwareErr{70};

/// An operating system error has been detected. This is intended to be used
/// for such things as "cannot fork", or "cannot create pipe".
constexpr Code OSErr{71};

/// Some system file (e.g. \p /etc/passwd) does not exist, cannot be opened,
/// or has some sort of error (e.g. syntax error).
constexpr Code OSFileErr{72};

/// A (user specified) output file cannot be created.
constexpr Code CantCreat{73};

/// An error occurred while doing I/O on some file.
constexpr Code IOErr{74};

/// Temporary failure, indicating something that is not really an error,
/// and the request should be reattempted later.
constexpr Code TempFail{75};

/// The remote system returned something that was "not possible" during a
/// protocol exchange.
constexpr Code ProtocolErr{76};

/// You did not have sufficient permission to perform the operation. This is
/// not intended for file system problems, which should use \p NoInput or
/// \p CantCreat, but rather for high level permissions.
constexpr Code NoPerm{77};

/// Something was found in an unconfigured or misconfigured state.
constexpr Code ConfigErr{78};

/// The first and last values of the \p sysexits(3) range.
constexpr Code Base = UsageErr;
constexpr Code Max = ConfigErr;

/// \returns whether \p C is one of the \p sysexits(3) failure codes.
[[nodiscard]] constexpr bool isSysexit(Code C) noexcept
{
  return Base.raw() <= C.raw() && C.raw() <= Max.raw();
}

/// \returns the \p sysexits(3) code that best describes an I/O failure of the
/// given \p Kind, if there is any.
[[nodiscard]] std::optional<Code> fromIOErrorKind(IOErrorKind Kind) noexcept;

/// \returns the symbolic name of \p C as in \p <sysexits.h> (e.g.
/// \p "EX_USAGE"), or \p nullptr if \p C is not a \p sysexits(3) code.
[[nodiscard]] const char* name(Code C) noexcept;

} // namespace procexit::sysexits
