/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <string>
#include <system_error>

#include <windows.h>

#include "ptyspawn/system/Platform.hpp"

namespace ptyspawn::system
{

template <> struct HandleTraits<PlatformTag::Win32>
{
  /// The kernel object handle type on Windows.
  using RawTy = ::HANDLE;

  /// A magic constant representing the invalid handle.
  ///
  /// \note \p INVALID_HANDLE_VALUE is never stored in a \p Handle.
  static constexpr RawTy Invalid = nullptr;

  /// Closes a \b raw kernel object handle.
  ///
  /// \returns the error reported by \p CloseHandle(), if any.
  static std::error_code close(RawTy Handle) noexcept;

  /// Formats the \b raw handle as a string.
  // NOLINTNEXTLINE(readability-identifier-naming)
  [[nodiscard]] static std::string to_string(RawTy Handle);
};

} // namespace ptyspawn::system
