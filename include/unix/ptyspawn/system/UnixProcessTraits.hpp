/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <string>

#include <unistd.h>

#include "ptyspawn/system/Platform.hpp"

namespace ptyspawn::system
{

template <> struct ProcessTraits<PlatformTag::Unix>
{
  /// Type alias for the raw process handle type on the platform.
  using raw_handle = ::pid_t;
  using RawTy = raw_handle;

  /// A magic constant representing the invalid process.
  static constexpr RawTy Invalid = -1;

  /// Platform-specific switches of process creation, passed through from the
  /// client unchanged.
  struct Attributes
  {
    /// Place the child into a new session with \p setsid(), detaching it from
    /// the controlling terminal of the current process.
    bool NewSession = true;
    /// Make the slave device the controlling terminal of the child, so the
    /// terminal-originated signals (\p SIGHUP, \p SIGWINCH) reach it.
    ///
    /// \note Only meaningful if \p NewSession is also set.
    bool ControllingTerminal = true;
  };
};

} // namespace ptyspawn::system
