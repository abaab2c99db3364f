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
#include <cstdint>
#include <iosfwd>
#include <optional>

namespace procexit
{

class Exit;
class ExitResult;
enum class IOErrorKind : int;

namespace system
{
class ProcessStatus;
} // namespace system

/// The exit code a process terminates with.
///
/// This is a thin value wrapper over the raw \p int the operating system
/// receives from \p exit(). Any value can be represented, but only the range
/// \p 0 to \p 255 is portable: Unix systems strip the higher order bits.
class Code
{
  int Value;

public:
  /// The process exited successfully.
  static const Code Success;
  /// Generic failure.
  static const Code Failure;
  /// Catch-all exit code when the process exits for an unknown reason.
  static const Code Unknown;
  /// The code reported when the actual one is not representable. This is
  /// \p Failure, so that falling back never reports a success.
  static const Code Default;

  /// Shells report a process killed by signal \p N as \p SignalBase + \p N.
  static constexpr int SignalBase = 128;

  /// The largest value that is representable on every platform.
  static constexpr int PortableMax = 255;

  /// Creates a \p Default code.
  constexpr Code() noexcept : Value(1) {}
  constexpr explicit Code(int Raw) noexcept : Value(Raw) {}

  [[nodiscard]] constexpr int raw() const noexcept { return Value; }

  /// \returns whether the code is exactly representable on all supported
  /// platforms.
  [[nodiscard]] constexpr bool isPortable() const noexcept
  {
    return 0 <= Value && Value <= PortableMax;
  }

  /// \returns the current code if it \p isPortable(), and nothing otherwise.
  [[nodiscard]] constexpr std::optional<Code> coerce() const noexcept
  {
    if (isPortable())
      return *this;
    return std::nullopt;
  }

  /// \returns the current code narrowed to the portable value range, if it
  /// fits.
  [[nodiscard]] constexpr std::optional<std::uint8_t>
  asPortable() const noexcept
  {
    if (isPortable())
      return static_cast<std::uint8_t>(Value);
    return std::nullopt;
  }

  [[nodiscard]] constexpr bool isSuccess() const noexcept { return Value == 0; }
  [[nodiscard]] constexpr bool isFailure() const noexcept
  {
    return !isSuccess();
  }

  /// \returns whether the code falls into one of the ranges that have a
  /// documented meaning: the generic codes, the \p sysexits(3) range, and the
  /// shell codes, including the ones derived from signals.
  ///
  /// Applications picking custom exit codes should avoid these.
  [[nodiscard]] bool isReserved() const noexcept;

  /// Terminates the current process with the current code.
  ///
  /// If the code is not portable, \p Default is used instead.
  [[noreturn]] void processExit() const;

  /// Terminates the current process with the current code, or \p Fallback if
  /// the code is not portable.
  [[noreturn]] void processExit(Code Fallback) const;

  /// Creates the code a shell would report for a process that was killed by
  /// \p Signal.
  [[nodiscard]] static constexpr Code fromSignal(int Signal) noexcept
  {
    return Code{SignalBase + Signal};
  }

  /// Converts the completion status of a child process to an exit code.
  ///
  /// If the process exited normally, its exit status is used. If it was
  /// killed by a signal, the corresponding shell signal code (\p 128 + \p N)
  /// is returned. Otherwise, the result is \p Default.
  [[nodiscard]] static Code fromStatus(const system::ProcessStatus& Status);

  /// Maps the kind of an I/O failure to the most fitting exit code.
  ///
  /// The \p sysexits(3) codes are considered first, then the signal codes.
  /// \p IOErrorKind::Other maps to \p Failure, and every remaining kind to
  /// \p sysexits::IOErr.
  [[nodiscard]] static Code fromIOErrorKind(IOErrorKind Kind) noexcept;

  /// \returns a successful result if the code is \p Success, and an error
  /// carrying the code otherwise.
  [[nodiscard]] ExitResult ok() const;

  /// Wraps the code into an \p Exit error without a message.
  ///
  /// \pre The code must not be \p Success.
  [[nodiscard]] Exit intoExit() const;

  /// Wraps the code into an \p Exit error that prints \p Msg when reported.
  ///
  /// \pre The code must not be \p Success.
  template <typename D> [[nodiscard]] Exit withMessage(D&& Msg) const;

  constexpr bool operator==(const Code& RHS) const noexcept
  {
    return Value == RHS.Value;
  }
  constexpr bool operator!=(const Code& RHS) const noexcept
  {
    return Value != RHS.Value;
  }
};

inline constexpr Code Code::Success{0};
inline constexpr Code Code::Failure{1};
inline constexpr Code Code::Unknown{2};
inline constexpr Code Code::Default = Code::Failure;

/// Prints the raw number of the code.
std::ostream& operator<<(std::ostream& OS, const Code& C);

} // namespace procexit
