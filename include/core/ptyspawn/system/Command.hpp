/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <optional>
#include <string>
#include <vector>

#include "ptyspawn/system/Cancellation.hpp"
#include "ptyspawn/system/PlatformTraits.hpp"

namespace ptyspawn::system
{

/// Describes the program to start on a terminal pair.
struct Command
{
  using Attributes = ProcessTraits<CurrentPlatform>::Attributes;

  /// The program to execute. If it contains no directory separator, the
  /// host's own executable search (\p PATH) finds it.
  std::string Program;
  /// The full argument vector, \p Arguments[0] conventionally being the name
  /// of the program.
  std::vector<std::string> Arguments;
  /// The environment of the child, as \p KEY=VALUE strings. If unset, the
  /// child inherits the environment of the current process.
  std::optional<std::vector<std::string>> Environment;
  /// The working directory of the child. If empty, the working directory of
  /// the current process is used.
  std::string WorkingDirectory;
  /// If cancellation is requested on this token, the child is killed.
  CancellationToken Cancel;
  /// Platform-specific switches of process creation.
  std::optional<Attributes> PlatformAttributes;
  /// If set, environment keys differing only in case are kept as different
  /// variables. Otherwise, the later one of them wins.
  bool CaseSensitiveEnvironment = false;

  /// Creates a command for \p Program, with the argument vector consisting of
  /// \p Program followed by \p Args.
  [[nodiscard]] static Command create(std::string Program,
                                      std::vector<std::string> Args = {});

  /// \throws LaunchError if the command can not be started at all.
  void validate() const;
};

} // namespace ptyspawn::system
