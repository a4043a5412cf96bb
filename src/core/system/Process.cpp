/* SPDX-License-Identifier: LGPL-3.0-only */
#include <utility>

#include "ptyspawn/system/Process.hpp"

#include "ptyspawn/Log.hpp"
#define LOG(SEVERITY) ptyspawn::log::SEVERITY("system/Process")

namespace ptyspawn::system
{

Process::Process(Raw Handle, std::shared_ptr<Pty> PTY)
  : Handle(Handle), PTY(std::move(PTY))
{}

void Process::startMonitor(ProcessMonitor::Actions Act,
                           const CancellationToken& Cancel)
{
  Monitor = std::make_unique<ProcessMonitor>(
    "PID " + std::to_string(Handle), std::move(Act));
  Monitor->start();

  if (!Cancel.cancellable())
    return;

  Cancellation = Cancel.onCancel([this] {
    LOG(debug) << "PID " << Handle << ": cancellation requested";
    std::error_code EC = kill();
    if (EC)
      LOG(error) << "PID " << Handle << ": kill failed: " << EC.message();
  });
}

void Process::shutdown() noexcept
{
  Cancellation = CancellationToken::Registration{};
  if (!Monitor)
    return;

  try
  {
    if (!Monitor->exited())
    {
      LOG(info) << "PID " << Handle << " still running on destruction, killing";
      std::error_code EC = Monitor->kill();
      if (EC)
        LOG(error) << "PID " << Handle << ": kill failed: " << EC.message();
    }
  }
  catch (const std::system_error& Err)
  {
    LOG(error) << "PID " << Handle << ": " << Err.what();
  }

  Monitor->join();
}

} // namespace ptyspawn::system

#undef LOG
