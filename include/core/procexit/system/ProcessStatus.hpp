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
#include <iosfwd>
#include <optional>

#include "procexit/Config.h"

namespace procexit::system
{

/// Describes how a child process finished.
///
/// A process either exited on its own with an exit status, or was killed by a
/// signal. If the status was obtained for a process that is only stopped or
/// continued, neither information is available.
class ProcessStatus
{
  std::optional<int> ExitStatus;
  std::optional<int> TermSignal;
  bool CoreDumped = false;

public:
  /// Creates a status that carries neither an exit status nor a signal.
  ProcessStatus() = default;

  /// Creates the status of a process that exited with \p Status.
  [[nodiscard]] static ProcessStatus exited(int Status) noexcept;

  /// Creates the status of a process killed by \p Signal.
  [[nodiscard]] static ProcessStatus signaled(int Signal,
                                              bool CoreDumped = false) noexcept;

#ifdef PROCEXIT_PLATFORM_UNIX
  /// Decodes the raw status word filled by \p waitpid().
  [[nodiscard]] static ProcessStatus fromWaitStatus(int WaitStatus) noexcept;
#endif /* PROCEXIT_PLATFORM_UNIX */

  /// \returns the exit status, if the process exited normally.
  [[nodiscard]] std::optional<int> exitStatus() const noexcept
  {
    return ExitStatus;
  }

  /// \returns the number of the signal that killed the process, if any.
  [[nodiscard]] std::optional<int> termSignal() const noexcept
  {
    return TermSignal;
  }

  [[nodiscard]] bool hasExited() const noexcept
  {
    return ExitStatus.has_value();
  }
  [[nodiscard]] bool wasSignaled() const noexcept
  {
    return TermSignal.has_value();
  }
  [[nodiscard]] bool coreDumped() const noexcept { return CoreDumped; }

  /// \returns whether the process exited normally with status \p 0.
  [[nodiscard]] bool isSuccess() const noexcept
  {
    return ExitStatus && *ExitStatus == 0;
  }
};

std::ostream& operator<<(std::ostream& OS, const ProcessStatus& Status);

} // namespace procexit::system
