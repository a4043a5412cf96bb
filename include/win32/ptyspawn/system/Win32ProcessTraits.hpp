/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <windows.h>

#include "ptyspawn/system/Platform.hpp"

namespace ptyspawn::system
{

template <> struct ProcessTraits<PlatformTag::Win32>
{
  /// The process identifier.
  using RawTy = ::DWORD;

  /// No process is ever assigned the identifier \p 0.
  static constexpr RawTy Invalid = 0;

  /// Platform-specific switches of process creation, passed through from the
  /// client unchanged.
  struct Attributes
  {
    /// Additional flags passed to \p CreateProcessW(), on top of the ones the
    /// attachment to the pseudo console needs.
    ::DWORD CreationFlags = 0;
    /// Start the window of the child hidden.
    bool HideWindow = false;
    /// If set, the child is started as the user represented by the token,
    /// with \p CreateProcessAsUserW(). The token is not owned.
    ::HANDLE Token = nullptr;
  };
};

} // namespace ptyspawn::system
