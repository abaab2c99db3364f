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

/// Exit codes with a special meaning to the Bash shell.
///
/// A process killed by signal \p N is reported by the shell with the exit code
/// \p 128 + \p N, see \p Code::fromSignal().
namespace procexit::bash
{

/// Command line usage error.
///
/// While Bash documents this as the misuse of shell builtins, it is more
/// broadly interpreted as a general usage error.
constexpr Code Usage{2};

/// Command was found but is not executable by the shell.
constexpr Code NotExecutable{126};

/// Usually indicates that the command was not found by the shell, or that the
/// command is found but that a library it requires is not found.
constexpr Code NotFound{127};

/// Invalid argument to \p exit.
constexpr Code InvalidExit{128};

/// \p exit takes only integer arguments in the range \p 0 - \p 255.
constexpr Code StatusOutOfRange{255};

/// Sent to a process when its controlling terminal is closed.
constexpr Code SigHUP = Code::fromSignal(1);

/// Sent to a process by its controlling terminal when a user wishes to
/// interrupt the process.
constexpr Code SigINT = Code::fromSignal(2);

/// Sent to a process by its controlling terminal when the user requests that
/// the process quits and performs a core dump.
constexpr Code SigQUIT = Code::fromSignal(3);

/// Sent to a process when it attempts to execute an illegal instruction.
constexpr Code SigILL = Code::fromSignal(4);

/// Sent to a process when a trace or breakpoint trap occurs.
constexpr Code SigTRAP = Code::fromSignal(5);

/// Sent to a process to tell it to abort, usually by itself via \p abort().
constexpr Code SigABRT = Code::fromSignal(6);

/// Sent to a process when it executes an erroneous arithmetic operation.
constexpr Code SigFPE = Code::fromSignal(8);

/// Sent to a process to cause it to terminate immediately. Unlike \p SIGTERM
/// and \p SIGINT, this signal cannot be caught or ignored, and the process
/// cannot perform any clean-up upon receiving it.
constexpr Code SigKILL = Code::fromSignal(9);

/// Sent to a process when it makes an invalid memory reference.
constexpr Code SigSEGV = Code::fromSignal(11);

/// Sent to a process when it attempts to write to a pipe without a process
/// connected to the other end.
constexpr Code SigPIPE = Code::fromSignal(13);

/// Sent to a process when a time limit set up by \p alarm() elapses.
constexpr Code SigALRM = Code::fromSignal(14);

/// Sent to a process to request its termination. Unlike \p SIGKILL, it can be
/// caught and interpreted or ignored by the process.
constexpr Code SigTERM = Code::fromSignal(15);

/// \returns the signal code a shell would report for a process that
/// encountered an I/O failure of the given \p Kind, if the failure is the
/// consequence of a signal.
///
/// Broken pipes, timeouts, and interruptions are mapped to \p SigPIPE,
/// \p SigALRM and \p SigINT, respectively.
[[nodiscard]] std::optional<Code> fromIOErrorKind(IOErrorKind Kind) noexcept;

} // namespace procexit::bash
