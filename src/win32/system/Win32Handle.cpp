/* SPDX-License-Identifier: LGPL-3.0-only */
#include <sstream>

#include "ptyspawn/CheckedWin32.hpp"

#include "ptyspawn/system/Win32HandleTraits.hpp"

#include "ptyspawn/Log.hpp"
#define LOG(SEVERITY) ptyspawn::log::SEVERITY("system/Win32Handle")

namespace ptyspawn::system
{

std::error_code HandleTraits<PlatformTag::Win32>::close(RawTy Handle) noexcept
{
  PTYSPAWN_TRACE_LOG(LOG(data) << "Closing handle #" << Handle << "...");
  auto Close =
    CheckedWin32([Handle] { return ::CloseHandle(Handle); }, FALSE);
  return Close.getError();
}

std::string HandleTraits<PlatformTag::Win32>::to_string(RawTy Handle)
{
  std::ostringstream OS;
  OS << Handle;
  return OS.str();
}

} // namespace ptyspawn::system

#undef LOG
