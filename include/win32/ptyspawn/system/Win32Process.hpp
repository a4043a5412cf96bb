/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "ptyspawn/system/Handle.hpp"
#include "ptyspawn/system/Process.hpp"

namespace ptyspawn::system::win32
{

/// A child process started with \p CreateProcessW(), hosted by a pseudo
/// console session.
class Process : public system::Process
{
public:
  /// Takes ownership of \p ProcessHandle.
  Process(Raw PID,
          system::Handle ProcessHandle,
          std::shared_ptr<system::Pty> PTY);
  ~Process() noexcept override;

  /// Starts \p Cmd inside the console session of \p PTY.
  ///
  /// The parent's standard handles are not given to the child: its standard
  /// streams are the ones of the console session. If anything fails after the
  /// child was created, the child is terminated before the error is thrown.
  [[nodiscard]] static std::unique_ptr<Process>
  launch(const Command& Cmd, std::shared_ptr<system::Pty> PTY);

  /// Converts the UTF-8 \p Str to UTF-16.
  ///
  /// \throws LaunchError if \p Str is not valid UTF-8.
  [[nodiscard]] static std::wstring widen(std::string_view Str);

  /// Quotes \p Arg so that the C runtime's command line parser of the child
  /// reads it back as a single argument, unchanged.
  [[nodiscard]] static std::string quoteArgument(std::string_view Arg);

  /// Joins the quoted \p Args into a single command line.
  [[nodiscard]] static std::string
  composeCommandLine(const std::vector<std::string>& Args);

  /// Creates the double \p NUL terminated UTF-16 environment block that
  /// \p CREATE_UNICODE_ENVIRONMENT expects.
  [[nodiscard]] static std::wstring
  createEnvironmentBlock(const std::vector<std::string>& Entries);

private:
  system::Handle ProcessHandle;
};

} // namespace ptyspawn::system::win32
