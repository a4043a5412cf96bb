/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <atomic>
#include <mutex>
#include <string>

#include "ptyspawn/Error.hpp"
#include "ptyspawn/system/ConsoleApi.hpp"
#include "ptyspawn/system/Pty.hpp"

namespace ptyspawn::system::win32
{

/// A terminal pair made of two anonymous pipes joined by a pseudo console
/// session.
///
/// The master endpoint (named \p "") holds the outward ends of the pipes: it
/// reads what the console renders, and writes the input of the console. The
/// slave endpoint (named \p "windows-pty") holds the console-facing ends until
/// a child is launched. Both endpoints report the console session as their
/// raw handle, for as long as the session is open.
class Pty : public system::Pty
{
public:
  /// The size of a new console session.
  static constexpr Size DefaultSize = {30, 80};

  /// Creates a new pseudo console session.
  ///
  /// \throws UnsupportedError if the host lacks pseudo consoles.
  /// \throws AllocationError if creating the pipes or the session failed.
  Pty();
  ~Pty() noexcept override;

  /// Executes \p F with the live console session handle, and prevents the
  /// session from being closed while \p F runs.
  ///
  /// \throws ClosedError if the session had already been closed.
  template <typename Fn> decltype(auto) withConsole(Fn&& F, const char* What)
  {
    std::lock_guard<std::mutex> L{ConsoleLock};
    ConsoleHandle Session = Console.load();
    if (!Session)
      throw ClosedError{std::string{What} + ": file already closed"};
    return F(Session);
  }

  /// \returns the console session handle, or \p nullptr once the session was
  /// closed.
  [[nodiscard]] ConsoleHandle session() const noexcept
  {
    return Console.load();
  }

  /// Closes the console session once the child is gone. The pipes stay open,
  /// so the output rendered before the exit can still be read from the
  /// master, until the end of the stream.
  std::error_code childExited() override;

protected:
  std::error_code destroy() override;
  void setSizeImpl(Size S) override;
  [[nodiscard]] Size getSizeImpl() override;

private:
  /// Closes the console session, if it is still open.
  void closeConsole() noexcept;

  std::mutex ConsoleLock;
  std::atomic<ConsoleHandle> Console{nullptr};
  /// The last size applied to the console session.
  Size Current = DefaultSize;
};

} // namespace ptyspawn::system::win32
