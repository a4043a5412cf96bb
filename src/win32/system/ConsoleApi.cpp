/* SPDX-License-Identifier: LGPL-3.0-only */
#include <sstream>

#include "ptyspawn/Error.hpp"
#include "ptyspawn/system/Platform.hpp"

#include "ptyspawn/system/ConsoleApi.hpp"

#include "ptyspawn/Log.hpp"
#define LOG(SEVERITY) ptyspawn::log::SEVERITY("system/ConsoleApi")

namespace ptyspawn::system::win32
{

namespace
{

template <typename FnTy> FnTy resolve(HMODULE Module, const char* Name)
{
  FARPROC Address = ::GetProcAddress(Module, Name);
  if (!Address)
    LOG(debug) << Name << "() is not available on this host";
  return reinterpret_cast<FnTy>(reinterpret_cast<void*>(Address));
}

} // namespace

ConsoleApi::ConsoleApi()
{
  HMODULE Kernel32 = ::GetModuleHandleW(L"kernel32.dll");
  if (!Kernel32)
  {
    LOG(error) << "kernel32.dll is not loaded?! Error "
               << ::GetLastError();
    return;
  }

  Create = resolve<CreateFn>(Kernel32, "CreatePseudoConsole");
  Resize = resolve<ResizeFn>(Kernel32, "ResizePseudoConsole");
  Close = resolve<CloseFn>(Kernel32, "ClosePseudoConsole");
}

const ConsoleApi& ConsoleApi::get()
{
  static const ConsoleApi Api;
  return Api;
}

const ConsoleApi& ConsoleApi::require()
{
  const ConsoleApi& Api = get();
  if (!Api.available())
  {
    std::ostringstream Msg;
    Msg << PTYSPAWN_FEED_PLATFORM_NOT_SUPPORTED_MESSAGE
        << "pseudo consoles (Windows 10 1809 or newer is required)";
    throw UnsupportedError{Msg.str()};
  }
  return Api;
}

} // namespace ptyspawn::system::win32

#undef LOG
