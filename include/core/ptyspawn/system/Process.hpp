/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <memory>
#include <system_error>

#include "ptyspawn/system/Cancellation.hpp"
#include "ptyspawn/system/Command.hpp"
#include "ptyspawn/system/ExitOutcome.hpp"
#include "ptyspawn/system/PlatformTraits.hpp"
#include "ptyspawn/system/ProcessMonitor.hpp"
#include "ptyspawn/system/Pty.hpp"

namespace ptyspawn::system
{

/// Responsible for creating and handling a child process that is attached to
/// the slave side of a terminal pair.
///
/// Destroying a \p Process whose child is still running kills the child.
class Process
{
public:
  /// Type alias for the raw process handle type on the platform.
  using Raw = PlatformSpecificProcessTraits::RawTy;

  Process(const Process&) = delete;
  Process& operator=(const Process&) = delete;
  virtual ~Process() noexcept = default;

  /// \returns the identifier of the child process.
  [[nodiscard]] Raw raw() const noexcept { return Handle; }

  /// \returns the terminal pair the child is attached to.
  [[nodiscard]] const std::shared_ptr<Pty>& getPty() const noexcept
  {
    return PTY;
  }

  /// Blocks until the child process terminated and its outcome is known.
  /// Any number of threads may wait concurrently, and all of them receive the
  /// same outcome.
  const ExitOutcome& wait() { return Monitor->wait(); }

  /// \returns whether the child process had been \b OBSERVED to be dead.
  [[nodiscard]] bool dead() const { return Monitor->exited(); }

  /// Forcefully terminates the child process. Does nothing if the child had
  /// already exited.
  std::error_code kill() { return Monitor->kill(); }

  /// Spawns \p Cmd as a new process, attached to the slave side of \p PTY.
  /// After the launch, the slave handles held by the current process are
  /// closed.
  ///
  /// \throws LaunchError if the process could not be started.
  /// \throws ClosedError if \p PTY had been torn down.
  [[nodiscard]] static std::unique_ptr<Process>
  spawn(const Command& Cmd, std::shared_ptr<Pty> PTY);

protected:
  Process(Raw Handle, std::shared_ptr<Pty> PTY);

  /// Starts monitoring the process with the platform-specific \p Act, and
  /// kills the process if \p Cancel fires.
  void startMonitor(ProcessMonitor::Actions Act, const CancellationToken& Cancel);

  /// Stops listening for cancellation, kills the child if it is still running,
  /// and waits for the monitor to finish. Meant to be called from the
  /// destructor of the implementations, as the monitor's actions refer to
  /// them.
  void shutdown() noexcept;

  Raw Handle = PlatformSpecificProcessTraits::Invalid;
  std::shared_ptr<Pty> PTY;
  std::unique_ptr<ProcessMonitor> Monitor;
  CancellationToken::Registration Cancellation;
};

} // namespace ptyspawn::system
