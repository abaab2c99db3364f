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
#include <cassert>
#include <exception>
#include <iosfwd>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

#include "procexit/Code.hpp"

namespace procexit
{

namespace detail
{

/// Type-erased interface over anything that can be printed as the message of
/// an \p Exit.
class Displayable
{
public:
  virtual ~Displayable() = default;
  virtual void display(std::ostream& OS) const = 0;
};

template <typename T> class DisplayableValue : public Displayable
{
  T Value;

public:
  explicit DisplayableValue(T Value) : Value(std::move(Value)) {}

  void display(std::ostream& OS) const override
  {
    if constexpr (std::is_same_v<T, std::error_code>)
      OS << Value.message();
    else if constexpr (std::is_base_of_v<std::exception, T>)
      OS << Value.what();
    else
      OS << Value;
  }
};

/// Messages given as C strings or string views are copied, so the \p Exit
/// never refers to a buffer it does not own.
template <typename D>
using StoredMessage =
  std::conditional_t<std::is_convertible_v<std::decay_t<D>, std::string_view>,
                     std::string,
                     std::decay_t<D>>;

} // namespace detail

/// Error type for exiting programs.
///
/// An \p Exit couples the \p Code the program should terminate with and an
/// optional message that is printed to the standard error stream when the
/// error is reported. Leaving the message empty allows exiting silently, e.g.
/// when the failure had already been reported through other means.
class Exit
{
  Code C;
  std::unique_ptr<detail::Displayable> Msg;

public:
  /// \pre \p C must not be \p Code::Success. If assertions are disabled, a
  /// \p Code::Success is replaced with \p Code::Default.
  explicit Exit(Code C);

  Exit(Exit&&) noexcept = default;
  Exit& operator=(Exit&&) noexcept = default;
  Exit(const Exit&) = delete;
  Exit& operator=(const Exit&) = delete;
  ~Exit() = default;

  [[nodiscard]] Code code() const noexcept { return C; }
  [[nodiscard]] bool hasMessage() const noexcept
  {
    return static_cast<bool>(Msg);
  }

  /// Sets the message printed when the error is reported, replacing the
  /// previous one.
  ///
  /// \p Message may be an \p std::exception (its \p what() is printed), an
  /// \p std::error_code (its \p message() is printed), or anything that can
  /// be written to an \p std::ostream.
  template <typename D> Exit& withMessage(D&& Message) &
  {
    using Stored = detail::StoredMessage<D>;
    Msg = std::make_unique<detail::DisplayableValue<Stored>>(
      Stored(std::forward<D>(Message)));
    return *this;
  }

  template <typename D> [[nodiscard]] Exit withMessage(D&& Message) &&
  {
    withMessage(std::forward<D>(Message));
    return std::move(*this);
  }

  /// \returns the rendered message, or an empty string if there is none.
  [[nodiscard]] std::string message() const;

  /// Converts an arbitrary displayable \p Err into an \p Exit that terminates
  /// with \p C and prints \p Err.
  template <typename E> [[nodiscard]] static Exit withCode(E&& Err, Code C)
  {
    return Exit{C}.withMessage(std::forward<E>(Err));
  }

  /// Converts the I/O failure \p EC into an \p Exit.
  ///
  /// The code is selected by \p Code::fromIOErrorKind() from the
  /// classification of \p EC, and the message is the description of the
  /// error.
  [[nodiscard]] static Exit fromIOError(const std::error_code& EC);

  /// Converts the I/O failure \p Err into an \p Exit, keeping the full
  /// \p what() of the exception as the message.
  [[nodiscard]] static Exit fromIOError(const std::system_error& Err);

  /// Prints the message, if any. The code itself is never printed.
  friend std::ostream& operator<<(std::ostream& OS, const Exit& E);
};

/// The result of an operation whose failure terminates the program.
///
/// The result is either a success or exactly one \p Exit error.
class [[nodiscard]] ExitResult
{
  std::optional<Exit> Error;

public:
  /// Creates a successful result.
  ExitResult() noexcept = default;
  ExitResult(Exit E) : Error(std::move(E)) {} // NOLINT(google-explicit-constructor)

  [[nodiscard]] static ExitResult success() noexcept { return {}; }

  explicit operator bool() const noexcept { return !Error; }
  [[nodiscard]] bool isSuccess() const noexcept { return !Error; }

  /// \pre The result is a failure.
  [[nodiscard]] Exit& getError() noexcept
  {
    assert(Error && "Successful result has no error!");
    return *Error;
  }
  [[nodiscard]] const Exit& getError() const noexcept
  {
    assert(Error && "Successful result has no error!");
    return *Error;
  }

  /// Moves the error out of the result.
  ///
  /// \pre The result is a failure.
  [[nodiscard]] Exit takeError() &&
  {
    assert(Error && "Successful result has no error!");
    return std::move(*Error);
  }
};

template <typename D> Exit Code::withMessage(D&& Msg) const
{
  return intoExit().withMessage(std::forward<D>(Msg));
}

/// Prints the message of the error in \p Result, if any, to the standard error
/// stream, and returns the code the program should exit with.
///
/// Failures of writing the message are ignored: the program is already
/// terminating, possibly exactly because the output stream is broken.
///
/// \note The library's own diagnostics are only emitted at \p log::Trace
/// severity, which also goes to the standard error stream if enabled.
Code report(ExitResult Result);

/// Prints the message of the error in \p Result, if any, to \p OS, and returns
/// the code the program should exit with.
Code report(ExitResult Result, std::ostream& OS);

/// Reports \p Result like \p report(), then terminates the process with the
/// resulting code.
[[noreturn]] void exit(ExitResult Result);

} // namespace procexit
