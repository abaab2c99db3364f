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
#include <cerrno>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

#include "procexit/Exit.hpp"

namespace procexit
{

namespace detail
{

template <typename R> struct Result
{
private:
  R Value;
  bool Errored;
  std::error_code ErrorCode;

public:
  Result(R&& Value, bool Errored, std::error_code Error)
    : Value(std::move(Value)), Errored(Errored), ErrorCode(Error)
  {}

  explicit operator bool() const noexcept { return !Errored; }
  std::error_code getError() const noexcept { return ErrorCode; }
  R& get() noexcept { return Value; }
  const R& get() const noexcept { return Value; }
};

template <> struct Result<void>
{
private:
  bool Errored;
  std::error_code ErrorCode;

public:
  Result(bool Errored, std::error_code Error)
    : Errored(Errored), ErrorCode(Error)
  {}

  explicit operator bool() const noexcept { return !Errored; }
  std::error_code getError() const noexcept { return ErrorCode; }
};

} // namespace detail

/// Allows executing a system call with automatically handled \p errno checking.
///
/// Clients MUST pass a lambda that returns the value of the system call, and
/// list ALL the values which might indicate a FAILED system call.
///
/// The result of the call itself is obtainable from the return value of this
/// function.
///
/// Example:
///
///   \code{.cpp}
///   auto Open = CheckedErrno([]() {
///     return ::open("foo", O_RDONLY);
///   }, /* ErrorIndicatingReturnValue =*/-1);
///
///   if (!Open)
///     return toSysexits(Open);
///   Open.get(); // Obtain the return value from the lambda.
///   \endcode
template <typename Fn, typename... ErrTys>
decltype(auto)
// NOLINTNEXTLINE(readability-identifier-naming)
CheckedErrno(Fn&& F, ErrTys&&... ErrorValues) noexcept
{
  using namespace procexit::detail;
  static_assert(!std::is_same_v<decltype(F()), void>,
                "Lambda must return something!");

  errno = 0;
  auto ReturnValue = F();
  bool Errored = (false || ... || (ReturnValue == ErrorValues));
  return Result<decltype(ReturnValue)>{
    std::move(ReturnValue),
    Errored,
    std::make_error_code(static_cast<std::errc>(errno))};
}

/// Allows executing a system call with translating an error to an exception.
///
/// Clients MUST pass a lambda that returns the value of the system call, and
/// list ALL the values which might indicate a FAILED system call.
///
/// The result of the call itself is returned by this function.
/// If the call fails, this function throws an \p std::system_error, which can
/// be turned into an \p Exit by \p Exit::fromIOError().
template <typename Fn, typename... ErrTys>
decltype(auto)
// NOLINTNEXTLINE(readability-identifier-naming)
CheckedErrnoThrow(Fn&& F, std::string ErrMsg, ErrTys&&... ErrorValues)
{
  auto Result =
    CheckedErrno(std::forward<Fn>(F), std::forward<ErrTys>(ErrorValues)...);
  if (!Result)
    throw std::system_error{Result.getError(), ErrMsg};

  // Make sure to not return an `int &` or something similar dangling!
  std::remove_reference_t<decltype(Result.get())> Copy = Result.get();
  return Copy;
}

/// Allows executing a system call with automatically handled \p errno checking.
///
/// This function allows for complex logic inside the callback, and complex
/// indication of errors.
///
/// Clients are encouraged to pass a lambda to which does the system call.
/// This lambda MUST take a single parameter, `bool& Error`, which the
/// caller MUST set to \p true if the syscall returned an error, appropriately.
/// The lambda MIGHT return additional values, which are obtainable from the
/// result of this call.
template <typename Fn>
decltype(auto)
CheckedErrno(Fn&& F) noexcept // NOLINT(readability-identifier-naming)
{
  using namespace procexit::detail;
  bool Errored = false;
  using result_type = decltype(F(Errored)); // What is the lambda returning?

  errno = 0;
  if constexpr (std::is_same_v<result_type, void>)
  {
    F(Errored);
    return Result<void>{Errored,
                        std::make_error_code(static_cast<std::errc>(errno))};
  }
  else
  {
    result_type R = F(Errored);
    return Result<result_type>{
      std::move(R),
      Errored,
      std::make_error_code(static_cast<std::errc>(errno))};
  }
}

/// Converts the outcome of a checked system call into an \p ExitResult.
///
/// A failed call is classified into the \p sysexits(3) or signal code that
/// best matches its \p errno, as if by \p Exit::fromIOError().
template <typename R>
[[nodiscard]] ExitResult toSysexits(const detail::Result<R>& Result)
{
  if (Result)
    return ExitResult::success();
  return Exit::fromIOError(Result.getError());
}

/// Converts the outcome of a checked system call into an \p ExitResult,
/// using the explicitly specified \p C if the call failed.
template <typename R>
[[nodiscard]] ExitResult withCode(const detail::Result<R>& Result, Code C)
{
  if (Result)
    return ExitResult::success();
  return Exit::withCode(Result.getError(), C);
}

} // namespace procexit
