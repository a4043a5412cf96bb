/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <memory>

#include <unistd.h>

#include "ptyspawn/system/Process.hpp"

namespace ptyspawn::system::unix
{

/// A child process started with \p fork() and \p exec(), in a new session
/// whose controlling terminal is the slave side of the pair.
class Process : public system::Process
{
public:
  Process(Raw PID, std::shared_ptr<system::Pty> PTY);
  ~Process() noexcept override;

  /// Send the \p Signal to the child process, unless it had already exited.
  std::error_code signal(int Signal);

  /// \p fork() and \p exec() \p Cmd, attached to the slave of \p PTY.
  ///
  /// Every piece of memory the child needs is prepared before the \p fork(),
  /// so the child only executes async-signal-safe calls. If \p exec() fails,
  /// the \p errno of the child is reported back through a close-on-exec pipe
  /// and thrown as a \p LaunchError.
  [[nodiscard]] static std::unique_ptr<Process>
  launch(const Command& Cmd, std::shared_ptr<system::Pty> PTY);
};

} // namespace ptyspawn::system::unix
