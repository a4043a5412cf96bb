/* SPDX-License-Identifier: LGPL-3.0-only */
#include <climits>
#include <string>
#include <thread>
#include <utility>

#include "ptyspawn/CheckedWin32.hpp"
#include "ptyspawn/adt/scope_guard.hpp"
#include "ptyspawn/system/Win32Endpoint.hpp"

#include "ptyspawn/system/Win32Pty.hpp"

#include "ptyspawn/Log.hpp"
#define LOG(SEVERITY) ptyspawn::log::SEVERITY("system/Win32Pty")

namespace ptyspawn::system
{

std::shared_ptr<Pty> Pty::create() { return std::make_shared<win32::Pty>(); }

namespace win32
{

static constexpr char MasterName[] = "";
/// The name OpenSSH for Windows reports for its pseudo terminals.
static constexpr char SlaveName[] = "windows-pty";

/// \throws RuntimeIOError if \p S does not fit the signed console
/// coordinates.
static COORD toCoord(Pty::Size S)
{
  constexpr auto Max = static_cast<unsigned short>(SHRT_MAX);
  if (S.Rows > Max || S.Columns > Max)
    throw RuntimeIOError{std::make_error_code(std::errc::invalid_argument),
                         "ResizePseudoConsole(): " + std::to_string(S.Rows) +
                           'x' + std::to_string(S.Columns) +
                           " is out of range"};

  COORD C;
  C.X = static_cast<SHORT>(S.Columns);
  C.Y = static_cast<SHORT>(S.Rows);
  return C;
}

/// Creates an anonymous pipe, returning the read and write ends.
static std::pair<Handle, Handle> createPipe()
{
  HANDLE Read = nullptr;
  HANDLE Write = nullptr;
  CheckedWin32Throw<AllocationError>(
    [&Read, &Write] { return ::CreatePipe(&Read, &Write, nullptr, 0); },
    "CreatePipe()",
    FALSE);
  return {Handle::wrap(Read), Handle::wrap(Write)};
}

Pty::Pty()
{
  const ConsoleApi& Api = ConsoleApi::require();

  auto [ConsoleIn, MasterWrite] = createPipe();
  auto [MasterRead, ConsoleOut] = createPipe();

  ConsoleHandle Session = nullptr;
  HRESULT HR =
    Api.Create(toCoord(DefaultSize), ConsoleIn, ConsoleOut, 0, &Session);
  if (FAILED(HR))
    throw AllocationError{hresultError(HR), "CreatePseudoConsole()"};

  scope_guard CloseSessionOnError{[&Api, Session] { Api.Close(Session); }};
  LOG(debug) << "Created pseudo console " << Session;

  adopt(std::make_unique<win32::Endpoint>(
          std::move(MasterRead), std::move(MasterWrite), MasterName),
        std::make_unique<win32::Endpoint>(
          std::move(ConsoleIn), std::move(ConsoleOut), SlaveName));
  Console.store(Session);
  CloseSessionOnError.dismiss();
}

Pty::~Pty() noexcept { closeOnDestruction(); }

void Pty::closeConsole() noexcept
{
  ConsoleHandle Session = nullptr;
  {
    std::lock_guard<std::mutex> L{ConsoleLock};
    Session = Console.exchange(nullptr);
  }
  if (!Session)
    return;

  LOG(debug) << "Closing pseudo console " << Session << "...";
  ConsoleApi::get().Close(Session);
}

std::error_code Pty::childExited()
{
  closeConsole();
  return {};
}

std::error_code Pty::destroy()
{
  auto& Master = static_cast<win32::Endpoint&>(master());

  std::error_code WriteError = Master.closeWrite();
  std::error_code SlaveError = closeEndpoint(slave());

  // Closing the session flushes the final frame into the output pipe, and
  // might block until somebody reads it.
  std::thread Drain{[Reader = Master.reader()] {
    char Buffer[4096];
    DWORD ReadBytes = 0;
    while (::ReadFile(Reader, Buffer, sizeof(Buffer), &ReadBytes, nullptr) &&
           ReadBytes > 0)
      PTYSPAWN_TRACE_LOG(LOG(data) << "Discarded " << ReadBytes
                                   << " bytes of output on teardown");
  }};
  closeConsole();
  Drain.join();

  std::error_code MasterError = closeEndpoint(master());
  if (WriteError)
    return WriteError;
  return MasterError ? MasterError : SlaveError;
}

void Pty::setSizeImpl(Size S)
{
  withConsole(
    [this, S](ConsoleHandle Session) {
      HRESULT HR = ConsoleApi::get().Resize(Session, toCoord(S));
      if (FAILED(HR))
        throw RuntimeIOError{hresultError(HR), "ResizePseudoConsole()"};
      Current = S;
    },
    "setsize");
}

Pty::Size Pty::getSizeImpl()
{
  return withConsole(
    [this](ConsoleHandle Session) {
      CONSOLE_SCREEN_BUFFER_INFO Info = {};
      if (::GetConsoleScreenBufferInfo(Session, &Info))
        return Size{
          static_cast<unsigned short>(Info.srWindow.Bottom -
                                      Info.srWindow.Top + 1),
          static_cast<unsigned short>(Info.srWindow.Right -
                                      Info.srWindow.Left + 1)};

      // The session handle is not a screen buffer on most hosts.
      PTYSPAWN_TRACE_LOG(LOG(trace) << "GetConsoleScreenBufferInfo() failed ("
                                    << ::GetLastError()
                                    << "), reporting the last applied size");
      return Current;
    },
    "getsize");
}

} // namespace win32
} // namespace ptyspawn::system

#undef LOG
