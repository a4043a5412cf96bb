/* SPDX-License-Identifier: LGPL-3.0-only */
#include <algorithm>
#include <limits>
#include <utility>

#include "ptyspawn/CheckedWin32.hpp"
#include "ptyspawn/Error.hpp"

#include "ptyspawn/system/Win32Endpoint.hpp"
#include "ptyspawn/system/Win32Pty.hpp"

#include "ptyspawn/Log.hpp"
#define LOG(SEVERITY) ptyspawn::log::SEVERITY("system/Win32Endpoint")
#define LOG_WITH_IDENTIFIER(SEVERITY) LOG(SEVERITY) << '"' << name() << "\": "

namespace ptyspawn::system::win32
{

static DWORD clampToDWORD(std::size_t Size) noexcept
{
  return static_cast<DWORD>(
    std::min<std::size_t>(Size, std::numeric_limits<DWORD>::max()));
}

Endpoint::Endpoint(Handle Read, Handle Write, std::string Name)
  : system::Endpoint(std::move(Name)), Read(std::move(Read)),
    Write(std::move(Write))
{}

Handle::Raw Endpoint::raw() const noexcept
{
  // Endpoints of this kind are only ever adopted by a pseudo console pair.
  const auto* Console = static_cast<const win32::Pty*>(owner());
  return Console ? Console->session() : nullptr;
}

std::size_t Endpoint::readImpl(char* Buffer, std::size_t Size)
{
  DWORD ReadBytes = 0;
  auto Result = CheckedWin32(
    [RawHandle = Read.get(), Buffer, Size, &ReadBytes] {
      return ::ReadFile(
        RawHandle, Buffer, clampToDWORD(Size), &ReadBytes, nullptr);
    },
    FALSE);
  if (!Result)
  {
    std::error_code EC = Result.getError();
    if (static_cast<DWORD>(EC.value()) == ERROR_BROKEN_PIPE)
    {
      PTYSPAWN_TRACE_LOG(LOG_WITH_IDENTIFIER(trace)
                         << "Writer side closed, end of stream.");
      return 0;
    }

    LOG_WITH_IDENTIFIER(error) << "Read error: " << EC.message();
    throw RuntimeIOError{EC, "read " + name()};
  }
  return ReadBytes;
}

std::size_t Endpoint::writeImpl(const char* Buffer, std::size_t Size)
{
  DWORD WrittenBytes = 0;
  auto Result = CheckedWin32(
    [RawHandle = Write.get(), Buffer, Size, &WrittenBytes] {
      return ::WriteFile(
        RawHandle, Buffer, clampToDWORD(Size), &WrittenBytes, nullptr);
    },
    FALSE);
  if (!Result)
  {
    std::error_code EC = Result.getError();
    LOG_WITH_IDENTIFIER(error) << "Write error: " << EC.message();
    throw RuntimeIOError{EC, "write " + name()};
  }
  return WrittenBytes;
}

std::error_code Endpoint::closeImpl() noexcept
{
  std::error_code ReadError = Read.close();
  std::error_code WriteError = Write.close();
  return ReadError ? ReadError : WriteError;
}

} // namespace ptyspawn::system::win32

#undef LOG_WITH_IDENTIFIER
#undef LOG
