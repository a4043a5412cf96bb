/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <functional>
#include <memory>
#include <vector>

#include "ptyspawn/Error.hpp"
#include "ptyspawn/system/Command.hpp"
#include "ptyspawn/system/Endpoint.hpp"
#include "ptyspawn/system/Process.hpp"
#include "ptyspawn/system/Pty.hpp"

namespace ptyspawn
{

using system::Command;
using system::Endpoint;
using system::Process;
using system::Pty;

/// A hook executed on a freshly allocated terminal pair, before the child
/// process is created.
using StartOption = std::function<void(Pty&)>;

/// \returns a start option that sets the size of the terminal before the child
/// starts, so the child never observes a different size.
[[nodiscard]] StartOption withInitialSize(unsigned short Rows,
                                          unsigned short Columns);

/// The result of \p start().
struct Spawned
{
  /// The terminal pair. Its \p master() is the endpoint to talk to the child
  /// through.
  std::shared_ptr<Pty> PTY;
  /// The child process attached to the slave side of \p PTY.
  std::unique_ptr<Process> Child;
};

/// Allocates a new terminal pair, with nothing attached to it.
///
/// \throws AllocationError
/// \throws UnsupportedError
[[nodiscard]] std::shared_ptr<Pty> open();

/// Allocates a new terminal pair, applies \p Options to it, and starts \p Cmd
/// attached to its slave side.
///
/// If any of the steps fail, the pair is closed before the error is thrown.
///
/// \throws AllocationError
/// \throws LaunchError
/// \throws UnsupportedError
[[nodiscard]] Spawned start(const Command& Cmd,
                            const std::vector<StartOption>& Options = {});

/// Resizes the terminal pair that \p E belongs to.
///
/// \throws NotAPtyError if \p E is not part of a terminal pair.
/// \throws ClosedError if the pair had been torn down.
void setSize(Endpoint& E, unsigned short Rows, unsigned short Columns);

/// \returns the size of the terminal pair that \p E belongs to.
///
/// \throws NotAPtyError if \p E is not part of a terminal pair.
/// \throws ClosedError if the pair had been torn down.
[[nodiscard]] Pty::Size getSizeFull(Endpoint& E);

} // namespace ptyspawn
