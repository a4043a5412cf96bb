/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <windows.h>

#ifndef PROC_THREAD_ATTRIBUTE_PSEUDOCONSOLE
/// Older SDKs do not know about the attribute, even if the host supports it.
#define PROC_THREAD_ATTRIBUTE_PSEUDOCONSOLE 0x00020016
#endif /* PROC_THREAD_ATTRIBUTE_PSEUDOCONSOLE */

namespace ptyspawn::system::win32
{

/// The opaque handle of a pseudo console session. (\p HPCON in the SDK.)
using ConsoleHandle = void*;

/// The pseudo console entry points of \p kernel32.dll, resolved at run time,
/// as hosts older than Windows 10 1809 lack them.
///
/// \see https://learn.microsoft.com/en-us/windows/console/pseudoconsoles
class ConsoleApi
{
public:
  using CreateFn = HRESULT(WINAPI*)(COORD, HANDLE, HANDLE, DWORD,
                                    ConsoleHandle*);
  using ResizeFn = HRESULT(WINAPI*)(ConsoleHandle, COORD);
  using CloseFn = void(WINAPI*)(ConsoleHandle);

  /// \returns the entry points, resolving them on the first call.
  [[nodiscard]] static const ConsoleApi& get();

  /// \returns the entry points.
  ///
  /// \throws UnsupportedError if the host lacks any of them.
  [[nodiscard]] static const ConsoleApi& require();

  /// \returns whether every entry point was found.
  [[nodiscard]] bool available() const noexcept
  {
    return Create && Resize && Close;
  }

  CreateFn Create = nullptr;
  ResizeFn Resize = nullptr;
  CloseFn Close = nullptr;

private:
  ConsoleApi();
};

} // namespace ptyspawn::system::win32
