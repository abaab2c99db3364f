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
#include <string>
#include <system_error>
#include <type_traits>

namespace procexit
{

/// A coarse, platform-independent categorisation of the reason an I/O
/// operation failed.
///
/// Most kinds correspond to a particular \p errno value. Some (e.g.
/// \p InvalidData or \p UnexpectedEof) have no system equivalent and are
/// raised by applications through \p make_error_code().
enum class IOErrorKind : int
{
  /// An entity was not found, often a file.
  NotFound = 1,
  /// The operation lacked the necessary privileges to complete.
  PermissionDenied,
  /// The connection was refused by the remote server.
  ConnectionRefused,
  /// The connection was reset by the remote server.
  ConnectionReset,
  /// The connection was aborted (terminated) by the remote server.
  ConnectionAborted,
  /// The network operation failed because it was not connected yet.
  NotConnected,
  /// A socket address could not be bound because the address is already in
  /// use elsewhere.
  AddrInUse,
  /// A nonexistent interface was requested or the requested address was not
  /// local.
  AddrNotAvailable,
  /// The operation failed because a pipe was closed.
  BrokenPipe,
  /// An entity already exists, often a file.
  AlreadyExists,
  /// The operation needs to block to complete, but the blocking operation was
  /// requested to not occur.
  WouldBlock,
  /// A parameter was incorrect.
  InvalidInput,
  /// Data not valid for the operation were encountered.
  InvalidData,
  /// The I/O operation's timeout expired.
  TimedOut,
  /// A write returned having written zero bytes of the requested amount.
  WriteZero,
  /// The operation was interrupted.
  Interrupted,
  /// The operation is unsupported on this platform.
  Unsupported,
  /// The read ended prematurely.
  UnexpectedEof,
  /// The operation could not allocate the memory it needed.
  OutOfMemory,
  /// A custom error that does not fall under any other kind.
  Other,
  /// An error reported by the system that this library does not know how to
  /// categorise.
  Uncategorized,
};

/// \returns a short human-readable description of the \p Kind.
[[nodiscard]] const char* name(IOErrorKind Kind) noexcept;

/// \returns the error category under which \p IOErrorKind values are
/// reported as \p std::error_code.
[[nodiscard]] const std::error_category& ioErrorCategory() noexcept;

/// Creates an \p std::error_code for an I/O failure of the given \p Kind.
// NOLINTNEXTLINE(readability-identifier-naming)
[[nodiscard]] std::error_code make_error_code(IOErrorKind Kind) noexcept;

/// Categorises an arbitrary error code into an \p IOErrorKind.
///
/// Codes of \p ioErrorCategory() are returned as they are. Codes of the
/// \p generic_category() and \p system_category() are mapped from their
/// \p errno value. Everything else is \p IOErrorKind::Uncategorized.
[[nodiscard]] IOErrorKind classify(const std::error_code& EC);

} // namespace procexit

namespace std
{

template <> struct is_error_code_enum<procexit::IOErrorKind> : true_type
{};

} // namespace std
