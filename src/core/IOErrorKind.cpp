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
#include <cerrno>

#include "procexit/IOErrorKind.hpp"

#include "procexit/Log.hpp"
#define LOG(SEVERITY) procexit::log::SEVERITY("IOErrorKind")

namespace procexit
{

const char* name(IOErrorKind Kind) noexcept
{
  switch (Kind)
  {
    case IOErrorKind::NotFound:
      return "entity not found";
    case IOErrorKind::PermissionDenied:
      return "permission denied";
    case IOErrorKind::ConnectionRefused:
      return "connection refused";
    case IOErrorKind::ConnectionReset:
      return "connection reset";
    case IOErrorKind::ConnectionAborted:
      return "connection aborted";
    case IOErrorKind::NotConnected:
      return "not connected";
    case IOErrorKind::AddrInUse:
      return "address in use";
    case IOErrorKind::AddrNotAvailable:
      return "address not available";
    case IOErrorKind::BrokenPipe:
      return "broken pipe";
    case IOErrorKind::AlreadyExists:
      return "entity already exists";
    case IOErrorKind::WouldBlock:
      return "operation would block";
    case IOErrorKind::InvalidInput:
      return "invalid input parameter";
    case IOErrorKind::InvalidData:
      return "invalid data";
    case IOErrorKind::TimedOut:
      return "timed out";
    case IOErrorKind::WriteZero:
      return "write zero";
    case IOErrorKind::Interrupted:
      return "operation interrupted";
    case IOErrorKind::Unsupported:
      return "unsupported";
    case IOErrorKind::UnexpectedEof:
      return "unexpected end of file";
    case IOErrorKind::OutOfMemory:
      return "out of memory";
    case IOErrorKind::Other:
      return "other error";
    case IOErrorKind::Uncategorized:
      return "uncategorized error";
  }
  return "unknown error kind";
}

namespace
{

class IOErrorCategory : public std::error_category
{
public:
  const char* name() const noexcept override { return "procexit.io"; }

  std::string message(int Value) const override
  {
    return procexit::name(static_cast<IOErrorKind>(Value));
  }
};

IOErrorKind fromErrno(int Errno) noexcept
{
  switch (Errno)
  {
    case ENOENT:
      return IOErrorKind::NotFound;
    case EACCES:
    case EPERM:
      return IOErrorKind::PermissionDenied;
    case ECONNREFUSED:
      return IOErrorKind::ConnectionRefused;
    case ECONNRESET:
      return IOErrorKind::ConnectionReset;
    case ECONNABORTED:
      return IOErrorKind::ConnectionAborted;
    case ENOTCONN:
      return IOErrorKind::NotConnected;
    case EADDRINUSE:
      return IOErrorKind::AddrInUse;
    case EADDRNOTAVAIL:
      return IOErrorKind::AddrNotAvailable;
    case EPIPE:
      return IOErrorKind::BrokenPipe;
    case EEXIST:
      return IOErrorKind::AlreadyExists;
    case EINVAL:
      return IOErrorKind::InvalidInput;
    case ETIMEDOUT:
      return IOErrorKind::TimedOut;
    case EINTR:
      return IOErrorKind::Interrupted;
    case ENOSYS:
      return IOErrorKind::Unsupported;
    case ENOMEM:
      return IOErrorKind::OutOfMemory;
    default:
      break;
  }

  // These might alias each other (or the ones above) on some platforms, so
  // they cannot be case labels.
  if (Errno == EAGAIN || Errno == EWOULDBLOCK)
    return IOErrorKind::WouldBlock;
  if (Errno == ENOTSUP || Errno == EOPNOTSUPP)
    return IOErrorKind::Unsupported;
  return IOErrorKind::Uncategorized;
}

} // namespace

const std::error_category& ioErrorCategory() noexcept
{
  static const IOErrorCategory Category{};
  return Category;
}

std::error_code make_error_code(IOErrorKind Kind) noexcept
{
  return {static_cast<int>(Kind), ioErrorCategory()};
}

IOErrorKind classify(const std::error_code& EC)
{
  IOErrorKind Kind = IOErrorKind::Uncategorized;
  if (EC.category() == ioErrorCategory())
  {
    if (EC.value() < static_cast<int>(IOErrorKind::NotFound) ||
        EC.value() > static_cast<int>(IOErrorKind::Uncategorized))
      return IOErrorKind::Uncategorized;
    Kind = static_cast<IOErrorKind>(EC.value());
  }
  else if (EC.category() == std::generic_category() ||
           EC.category() == std::system_category())
    Kind = fromErrno(EC.value());

  PROCEXIT_TRACE_LOG(LOG(trace) << "Error " << EC.category().name() << ':'
                                << EC.value() << " classified as \""
                                << name(Kind) << '"');
  return Kind;
}

} // namespace procexit
