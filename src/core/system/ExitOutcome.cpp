/* SPDX-License-Identifier: LGPL-3.0-only */
#include <sstream>

#include "ptyspawn/Error.hpp"

#include "ptyspawn/system/ExitOutcome.hpp"

namespace ptyspawn::system
{

ExitOutcome ExitOutcome::exited(int Code) noexcept
{
  ExitOutcome O;
  O.Terminated = true;
  O.Code = Code;
  return O;
}

ExitOutcome ExitOutcome::signalled(int Signal) noexcept
{
  ExitOutcome O;
  O.Terminated = true;
  O.Signal = Signal;
  return O;
}

ExitOutcome ExitOutcome::waitFailed(std::error_code Error) noexcept
{
  ExitOutcome O;
  O.Error = Error;
  return O;
}

ExitOutcome ExitOutcome::withTeardownError(std::error_code Error) const noexcept
{
  ExitOutcome O = *this;
  if (succeeded())
    O.Error = Error;
  return O;
}

ExitOutcome::Status ExitOutcome::status() const noexcept
{
  if (pending())
    return Status::Pending;
  if (Error || exitedAbnormally())
    return Status::Failed;
  return Status::Succeeded;
}

int ExitOutcome::exitCode() const noexcept
{
  if (!Terminated || Signal != 0)
    return -1;
  return Code;
}

std::string ExitOutcome::describe() const
{
  std::ostringstream Buf;
  if (pending())
    Buf << "pending";
  else if (Signal != 0)
    Buf << "signal: " << Signal;
  else if (Terminated)
    Buf << "exit status " << Code;

  if (Error)
  {
    if (Terminated)
      Buf << ", ";
    Buf << Error.message();
  }
  return Buf.str();
}

void ExitOutcome::check() const
{
  if (exitedAbnormally())
    throw ProcessExitError{exitCode(), Signal, describe()};
  if (Error)
    throw ptyspawn::Error{this->Error, describe()};
}

} // namespace ptyspawn::system
