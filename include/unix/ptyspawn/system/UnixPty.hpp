/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include "ptyspawn/system/Pty.hpp"
#include "ptyspawn/system/fd.hpp"

namespace ptyspawn::system::unix
{

/// A terminal pair backed by the kernel's pseudoterminal device.
///
/// The master endpoint is named after the multiplexer, \p /dev/ptmx, and the
/// slave endpoint carries the path of the device the kernel assigned.
///
/// \see pty(7)
/// \see openpty(3)
class Pty : public system::Pty
{
public:
  /// Creates a new PTY-pair.
  ///
  /// \throws AllocationError if \p openpty() failed.
  Pty();
  ~Pty() noexcept override;

  /// Sets the window size of the terminal device \p FD.
  ///
  /// \throws NotAPtyError if \p FD is not a terminal.
  static void setWindowSize(fd::raw_fd FD, Size S);
  /// \returns the window size of the terminal device \p FD.
  ///
  /// \throws NotAPtyError if \p FD is not a terminal.
  [[nodiscard]] static Size getWindowSize(fd::raw_fd FD);

protected:
  std::error_code destroy() override;
  void setSizeImpl(Size S) override;
  [[nodiscard]] Size getSizeImpl() override;
};

} // namespace ptyspawn::system::unix
