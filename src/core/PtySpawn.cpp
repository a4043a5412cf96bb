/* SPDX-License-Identifier: LGPL-3.0-only */
#include <utility>

#include "ptyspawn/adt/scope_guard.hpp"

#include "ptyspawn/PtySpawn.hpp"

#include "ptyspawn/Log.hpp"
#define LOG(SEVERITY) ptyspawn::log::SEVERITY("PtySpawn")

namespace ptyspawn
{

namespace
{

Pty& ownerOf(Endpoint& E, const char* What)
{
  Pty* Owner = E.owner();
  if (!Owner)
    throw NotAPtyError{std::string{What} + " " + E.name() + ": not a pty"};
  return *Owner;
}

} // namespace

StartOption withInitialSize(unsigned short Rows, unsigned short Columns)
{
  return [Rows, Columns](Pty& P) { P.setSize(Rows, Columns); };
}

std::shared_ptr<Pty> open() { return Pty::create(); }

Spawned start(const Command& Cmd, const std::vector<StartOption>& Options)
{
  Spawned S;
  S.PTY = open();

  scope_guard CloseOnError{[&S] {
    try
    {
      std::error_code EC = S.PTY->close();
      if (EC)
        LOG(error) << "Closing the terminal after a failed start: "
                   << EC.message();
    }
    catch (const std::system_error& Err)
    {
      LOG(error) << "Closing the terminal after a failed start: "
                 << Err.what();
    }
  }};

  for (const StartOption& Option : Options)
    Option(*S.PTY);

  S.Child = Process::spawn(Cmd, S.PTY);
  CloseOnError.dismiss();
  return S;
}

void setSize(Endpoint& E, unsigned short Rows, unsigned short Columns)
{
  ownerOf(E, "setsize").setSize(Rows, Columns);
}

Pty::Size getSizeFull(Endpoint& E) { return ownerOf(E, "getsize").getSize(); }

} // namespace ptyspawn

#undef LOG
