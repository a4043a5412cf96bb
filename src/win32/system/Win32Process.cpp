/* SPDX-License-Identifier: LGPL-3.0-only */
#include <utility>
#include <vector>

#include "ptyspawn/CheckedWin32.hpp"
#include "ptyspawn/Error.hpp"
#include "ptyspawn/system/ConsoleApi.hpp"
#include "ptyspawn/system/Environment.hpp"
#include "ptyspawn/system/Win32Pty.hpp"

#include "ptyspawn/system/Win32Process.hpp"

#include "ptyspawn/Log.hpp"
#define LOG(SEVERITY) ptyspawn::log::SEVERITY("system/Win32Process")

namespace ptyspawn::system
{

std::unique_ptr<Process> Process::spawn(const Command& Cmd,
                                        std::shared_ptr<Pty> PTY)
{
  return win32::Process::launch(Cmd, std::move(PTY));
}

namespace win32
{

namespace
{

/// Owns an initialised process-thread attribute list.
class AttributeList
{
public:
  explicit AttributeList(DWORD Count)
  {
    SIZE_T Size = 0;
    // Only queries the required size, and fails with
    // ERROR_INSUFFICIENT_BUFFER.
    ::InitializeProcThreadAttributeList(nullptr, Count, 0, &Size);
    Storage.resize(Size);

    CheckedWin32Throw<LaunchError>(
      [this, Count, &Size] {
        return ::InitializeProcThreadAttributeList(get(), Count, 0, &Size);
      },
      "InitializeProcThreadAttributeList()",
      FALSE);
  }

  AttributeList(const AttributeList&) = delete;
  AttributeList& operator=(const AttributeList&) = delete;
  ~AttributeList() noexcept { ::DeleteProcThreadAttributeList(get()); }

  LPPROC_THREAD_ATTRIBUTE_LIST get() noexcept
  {
    return reinterpret_cast<LPPROC_THREAD_ATTRIBUTE_LIST>(Storage.data());
  }

  /// Attaches the created process to the \p Session.
  void setPseudoConsole(ConsoleHandle Session)
  {
    CheckedWin32Throw<LaunchError>(
      [this, Session] {
        return ::UpdateProcThreadAttribute(get(),
                                           0,
                                           PROC_THREAD_ATTRIBUTE_PSEUDOCONSOLE,
                                           Session,
                                           sizeof(Session),
                                           nullptr,
                                           nullptr);
      },
      "UpdateProcThreadAttribute(PSEUDOCONSOLE)",
      FALSE);
  }

private:
  std::vector<char> Storage;
};

/// Finds \p Program with the search order of the host, appending \p .exe if
/// the name lacks an extension.
std::wstring resolveExecutable(const std::string& Program)
{
  std::wstring Name = Process::widen(Program);
  auto Query = CheckedWin32(
    [&Name] {
      return ::SearchPathW(nullptr, Name.c_str(), L".exe", 0, nullptr, nullptr);
    },
    0U);
  if (!Query)
    throw LaunchError{Query.getError(), "exec: " + Program};

  std::wstring Path(Query.get(), L'\0');
  auto Search = CheckedWin32(
    [&Name, &Path] {
      return ::SearchPathW(nullptr,
                           Name.c_str(),
                           L".exe",
                           static_cast<DWORD>(Path.size()),
                           Path.data(),
                           nullptr);
    },
    0U);
  if (!Search)
    throw LaunchError{Search.getError(), "exec: " + Program};
  Path.resize(Search.get());
  return Path;
}

ProcessMonitor::Actions monitorActions(HANDLE ProcessHandle,
                                       std::shared_ptr<system::Pty> PTY)
{
  ProcessMonitor::Actions Act;
  Act.AwaitExit = [ProcessHandle] {
    auto Waited = CheckedWin32(
      [ProcessHandle] {
        return ::WaitForSingleObject(ProcessHandle, INFINITE);
      },
      WAIT_FAILED);
    return Waited.getError();
  };
  Act.Collect = [ProcessHandle] {
    DWORD ExitCode = 0;
    auto Query = CheckedWin32(
      [ProcessHandle, &ExitCode] {
        return ::GetExitCodeProcess(ProcessHandle, &ExitCode);
      },
      FALSE);
    if (!Query)
      throw std::system_error{Query.getError(), "GetExitCodeProcess()"};
    return ExitOutcome::exited(static_cast<int>(ExitCode));
  };
  Act.Terminate = [ProcessHandle] {
    auto Terminated = CheckedWin32(
      [ProcessHandle] { return ::TerminateProcess(ProcessHandle, 1); },
      FALSE);
    return Terminated.getError();
  };
  Act.Teardown = [PTY = std::move(PTY)] { return PTY->childExited(); };
  return Act;
}

} // namespace

Process::Process(Raw PID,
                 system::Handle ProcessHandle,
                 std::shared_ptr<system::Pty> PTY)
  : system::Process(PID, std::move(PTY)),
    ProcessHandle(std::move(ProcessHandle))
{}

Process::~Process() noexcept { shutdown(); }

std::wstring Process::widen(std::string_view Str)
{
  if (Str.empty())
    return {};

  int Length = CheckedWin32Throw<LaunchError>(
    [Str] {
      return ::MultiByteToWideChar(CP_UTF8,
                                   MB_ERR_INVALID_CHARS,
                                   Str.data(),
                                   static_cast<int>(Str.size()),
                                   nullptr,
                                   0);
    },
    "MultiByteToWideChar()",
    0);
  std::wstring Result(static_cast<std::size_t>(Length), L'\0');
  CheckedWin32Throw<LaunchError>(
    [Str, &Result] {
      return ::MultiByteToWideChar(CP_UTF8,
                                   MB_ERR_INVALID_CHARS,
                                   Str.data(),
                                   static_cast<int>(Str.size()),
                                   Result.data(),
                                   static_cast<int>(Result.size()));
    },
    "MultiByteToWideChar()",
    0);
  return Result;
}

std::string Process::quoteArgument(std::string_view Arg)
{
  if (Arg.empty())
    return "\"\"";
  if (Arg.find_first_of(" \t\n\v\"") == std::string_view::npos)
    return std::string{Arg};

  std::string Quoted = "\"";
  std::size_t Backslashes = 0;
  for (char C : Arg)
  {
    if (C == '\\')
    {
      ++Backslashes;
      continue;
    }

    if (C == '"')
      // Every backslash before a quote is escaped, and so is the quote.
      Quoted.append(Backslashes * 2 + 1, '\\');
    else
      Quoted.append(Backslashes, '\\');
    Quoted.push_back(C);
    Backslashes = 0;
  }
  // The closing quote must not be escaped by the trailing backslashes.
  Quoted.append(Backslashes * 2, '\\');
  Quoted.push_back('"');
  return Quoted;
}

std::string Process::composeCommandLine(const std::vector<std::string>& Args)
{
  std::string CommandLine;
  for (const std::string& Arg : Args)
  {
    if (!CommandLine.empty())
      CommandLine.push_back(' ');
    CommandLine.append(quoteArgument(Arg));
  }
  return CommandLine;
}

std::wstring
Process::createEnvironmentBlock(const std::vector<std::string>& Entries)
{
  if (Entries.empty())
    return std::wstring(2, L'\0');

  std::wstring Block;
  for (const std::string& Entry : Entries)
  {
    Block.append(widen(Entry));
    Block.push_back(L'\0');
  }
  Block.push_back(L'\0');
  return Block;
}

std::unique_ptr<Process> Process::launch(const Command& Cmd,
                                         std::shared_ptr<system::Pty> PTY)
{
  Cmd.validate();
  if (!PTY)
    throw LaunchError{std::make_error_code(std::errc::invalid_argument),
                      "exec: " + Cmd.Program + ": no terminal to attach to"};
  auto* Console = dynamic_cast<win32::Pty*>(PTY.get());
  if (!Console)
    throw NotAPtyError{"exec: " + Cmd.Program};
  if (!PTY->isOpen())
    throw ClosedError{"exec: " + Cmd.Program + ": terminal"};

  Command::Attributes Attrs =
    Cmd.PlatformAttributes.value_or(Command::Attributes{});
  std::wstring Application = resolveExecutable(Cmd.Program);
  std::wstring CommandLine = widen(composeCommandLine(Cmd.Arguments));
  std::wstring Environment = createEnvironmentBlock(
    childEnvironment(Cmd.Environment, Cmd.CaseSensitiveEnvironment));
  std::wstring Directory = widen(Cmd.WorkingDirectory);

  STARTUPINFOEXW StartupInfo = {};
  StartupInfo.StartupInfo.cb = sizeof(StartupInfo);
  // The standard handles are left empty, so the child does not receive the
  // ones of the current process.
  StartupInfo.StartupInfo.dwFlags = STARTF_USESTDHANDLES;
  if (Attrs.HideWindow)
  {
    StartupInfo.StartupInfo.dwFlags |= STARTF_USESHOWWINDOW;
    StartupInfo.StartupInfo.wShowWindow = SW_HIDE;
  }
  DWORD Flags = Attrs.CreationFlags | CREATE_UNICODE_ENVIRONMENT |
                EXTENDED_STARTUPINFO_PRESENT;

  LOG(debug) << "Spawning '" << Cmd.Program << "' on " << PTY->slave().name();
  PTYSPAWN_TRACE_LOG(LOG(data) << "    Command line: "
                               << composeCommandLine(Cmd.Arguments));

  PROCESS_INFORMATION Info = {};
  Console->withConsole(
    [&](ConsoleHandle Session) {
      AttributeList Attributes{1};
      Attributes.setPseudoConsole(Session);
      StartupInfo.lpAttributeList = Attributes.get();

      auto Created = CheckedWin32(
        [&] {
          LPCWSTR Dir = Directory.empty() ? nullptr : Directory.c_str();
          if (Attrs.Token)
            return ::CreateProcessAsUserW(Attrs.Token,
                                          Application.c_str(),
                                          CommandLine.data(),
                                          nullptr,
                                          nullptr,
                                          FALSE,
                                          Flags,
                                          Environment.data(),
                                          Dir,
                                          &StartupInfo.StartupInfo,
                                          &Info);
          return ::CreateProcessW(Application.c_str(),
                                  CommandLine.data(),
                                  nullptr,
                                  nullptr,
                                  FALSE,
                                  Flags,
                                  Environment.data(),
                                  Dir,
                                  &StartupInfo.StartupInfo,
                                  &Info);
        },
        FALSE);
      if (!Created)
      {
        LOG(debug) << "Starting '" << Cmd.Program
                   << "' failed: " << Created.getError().message();
        throw LaunchError{Created.getError(), "exec: " + Cmd.Program};
      }
    },
    "exec");

  system::Handle Thread = system::Handle::wrap(Info.hThread);
  system::Handle ProcessHandle = system::Handle::wrap(Info.hProcess);
  LOG(debug) << "PID " << Info.dwProcessId << " spawned.";

  std::unique_ptr<Process> P;
  try
  {
    P = std::make_unique<Process>(
      Info.dwProcessId, std::move(ProcessHandle), PTY);

    std::error_code SlaveError = PTY->releaseSlave();
    if (SlaveError)
      LOG(warn) << "Releasing the slave side failed: "
                << SlaveError.message();

    P->startMonitor(monitorActions(Info.hProcess, std::move(PTY)), Cmd.Cancel);
  }
  catch (const std::exception& Ex)
  {
    LOG(error) << "Setting up PID " << Info.dwProcessId
               << " failed, terminating it: " << Ex.what();
    if (!::TerminateProcess(Info.hProcess, 1))
      LOG(error) << "Terminating PID " << Info.dwProcessId
                 << " failed: " << ::GetLastError();
    throw;
  }
  return P;
}

} // namespace win32
} // namespace ptyspawn::system

#undef LOG
