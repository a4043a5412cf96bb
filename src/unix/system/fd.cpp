/* SPDX-License-Identifier: LGPL-3.0-only */
#include <unistd.h>

#include "ptyspawn/CheckedErrno.hpp"

#include "ptyspawn/system/fd.hpp"

#include "ptyspawn/Log.hpp"
#define LOG(SEVERITY) ptyspawn::log::SEVERITY("system/fd")

namespace ptyspawn::system
{

std::error_code HandleTraits<PlatformTag::Unix>::close(raw_fd FD) noexcept
{
  PTYSPAWN_TRACE_LOG(LOG(data) << "Closing FD #" << FD << "...");
  auto Close = CheckedErrno([FD] { return ::close(FD); }, -1);
  return Close.getError();
}

std::string HandleTraits<PlatformTag::Unix>::to_string(raw_fd FD)
{
  return std::to_string(FD);
}

namespace unix
{

fd::fd(raw_fd Value) noexcept : Handle(Value) {}

std::pair<fd, fd> fd::pipe()
{
  raw_fd PipeFDs[2] = {Traits::Invalid, Traits::Invalid};
  CheckedErrnoThrow(
    [&PipeFDs] { return ::pipe2(PipeFDs, O_CLOEXEC); }, "pipe2()", -1);

  PTYSPAWN_TRACE_LOG(LOG(data) << "Created anonymous pipe (read: "
                               << PipeFDs[0] << ", write: " << PipeFDs[1]
                               << ')');
  return {fd{PipeFDs[0]}, fd{PipeFDs[1]}};
}

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
fd fd::duplicateAbove(raw_fd FD, raw_fd Floor)
{
  raw_fd Copy = CheckedErrnoThrow(
    [FD, Floor] { return ::fcntl(FD, F_DUPFD_CLOEXEC, Floor + 1); },
    "fcntl(F_DUPFD_CLOEXEC)",
    -1);
  PTYSPAWN_TRACE_LOG(LOG(data) << "Duplicated FD #" << FD << " as #" << Copy);
  return fd{Copy};
}

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
void fd::addDescriptorFlag(raw_fd FD, flag_t Flag)
{
  flag_t FlagsNow =
    CheckedErrnoThrow([FD] { return ::fcntl(FD, F_GETFD); }, "fcntl()", -1);

  FlagsNow |= Flag;

  CheckedErrnoThrow(
    [FD, FlagsNow] { return ::fcntl(FD, F_SETFD, FlagsNow); }, "fcntl()", -1);
}

} // namespace unix
} // namespace ptyspawn::system

#undef LOG
