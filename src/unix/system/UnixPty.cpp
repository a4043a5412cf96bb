/* SPDX-License-Identifier: LGPL-3.0-only */
#include <climits>

#include <pty.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include "ptyspawn/CheckedErrno.hpp"
#include "ptyspawn/Error.hpp"
#include "ptyspawn/system/UnixEndpoint.hpp"

#include "ptyspawn/system/UnixPty.hpp"

#include "ptyspawn/Log.hpp"
#define LOG(SEVERITY) ptyspawn::log::SEVERITY("system/UnixPty")

namespace ptyspawn::system
{

std::shared_ptr<Pty> Pty::create() { return std::make_shared<unix::Pty>(); }

namespace unix
{

static constexpr char MasterName[] = "/dev/ptmx";

Pty::Pty()
{
  fd::raw_fd MasterFD = fd::Traits::Invalid;
  fd::raw_fd SlaveFD = fd::Traits::Invalid;
  char DeviceName[PATH_MAX] = {};

  CheckedErrnoThrow<AllocationError>(
    [&MasterFD, &SlaveFD, &DeviceName] {
      return ::openpty(&MasterFD, &SlaveFD, DeviceName, nullptr, nullptr);
    },
    "openpty()",
    -1);
  fd Master{MasterFD};
  fd Slave{SlaveFD};

  LOG(debug) << "Opened " << DeviceName << " (master: " << MasterFD
             << ", slave: " << SlaveFD << ')';

  try
  {
    // Children spawned after this point do not inherit the pair. openpty()
    // has no close-on-exec flag, so a fork() on another thread between the
    // two calls still can.
    fd::setCloseOnExec(MasterFD);
    fd::setCloseOnExec(SlaveFD);
  }
  catch (const std::system_error& Err)
  {
    throw AllocationError{Err.code(), "openpty(): marking close-on-exec"};
  }

  adopt(std::make_unique<unix::Endpoint>(std::move(Master), MasterName, true),
        std::make_unique<unix::Endpoint>(std::move(Slave), DeviceName));
}

Pty::~Pty() noexcept { closeOnDestruction(); }

std::error_code Pty::destroy()
{
  std::error_code MasterError = closeEndpoint(master());
  std::error_code SlaveError = closeEndpoint(slave());
  return MasterError ? MasterError : SlaveError;
}

void Pty::setWindowSize(fd::raw_fd FD, Size S)
{
  struct ::winsize WS = {};
  WS.ws_row = S.Rows;
  WS.ws_col = S.Columns;

  auto Set =
    CheckedErrno([FD, &WS] { return ::ioctl(FD, TIOCSWINSZ, &WS); }, -1);
  if (!Set)
  {
    if (Set.getError() == std::errc::inappropriate_io_control_operation)
      throw NotAPtyError{"ioctl(TIOCSWINSZ)"};
    throw RuntimeIOError{Set.getError(), "ioctl(TIOCSWINSZ)"};
  }
}

Pty::Size Pty::getWindowSize(fd::raw_fd FD)
{
  struct ::winsize WS = {};
  auto Get =
    CheckedErrno([FD, &WS] { return ::ioctl(FD, TIOCGWINSZ, &WS); }, -1);
  if (!Get)
  {
    if (Get.getError() == std::errc::inappropriate_io_control_operation)
      throw NotAPtyError{"ioctl(TIOCGWINSZ)"};
    throw RuntimeIOError{Get.getError(), "ioctl(TIOCGWINSZ)"};
  }
  return {WS.ws_row, WS.ws_col};
}

void Pty::setSizeImpl(Size S) { setWindowSize(master().raw(), S); }

Pty::Size Pty::getSizeImpl() { return getWindowSize(master().raw()); }

} // namespace unix
} // namespace ptyspawn::system

#undef LOG
