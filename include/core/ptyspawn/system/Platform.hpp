/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <string>
#include <vector>

#include "ptyspawn/Config.h"

/// A generic macro that prints to some \p ostream the prefix for a "platform
/// not supported" message.
#define PTYSPAWN_FEED_PLATFORM_NOT_SUPPORTED_MESSAGE                           \
  "The current platform " << '(' << PTYSPAWN_PLATFORM << ')'                   \
                          << " does not support "

namespace ptyspawn::system
{

enum class PlatformTag
{
  Unsupported = PTYSPAWN_PLATFORM_ID_Unsupported,

  /// Standard UNIX and POSIX systems, where the kernel provides a
  /// terminal-pair device.
  Unix = PTYSPAWN_PLATFORM_ID_Unix,

  /// Windows hosts, where a pseudo console session is joined to pipes.
  Win32 = PTYSPAWN_PLATFORM_ID_Win32
};

/// Dummy class that is implemented by platform-specific details to provide
/// business logic to \p Handle and keep it as a value-semantics-capable class.
template <PlatformTag> struct HandleTraits
{};

/// Dummy class that is implemented by platform-specific details to provide
/// business logic to \p Process.
template <PlatformTag> struct ProcessTraits
{};

/// Base class for querying platform-specific bits of information.
class Platform
{
public:
  /// \returns the names of the environment variables that a child process on
  /// the current platform can not reasonably run without. If the environment
  /// given to a child lacks any of these, the value is copied from the
  /// environment of the current process.
  [[nodiscard]] static const std::vector<std::string>& mandatoryEnvironment();
};

} // namespace ptyspawn::system
