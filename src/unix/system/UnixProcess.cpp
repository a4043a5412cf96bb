/* SPDX-License-Identifier: LGPL-3.0-only */
#include <csignal>
#include <string>
#include <utility>
#include <vector>

#include <sys/ioctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "ptyspawn/CheckedErrno.hpp"
#include "ptyspawn/Error.hpp"
#include "ptyspawn/system/Environment.hpp"
#include "ptyspawn/system/fd.hpp"
#include "ptyspawn/unreachable.hpp"

#include "ptyspawn/system/UnixProcess.hpp"

#include "ptyspawn/Log.hpp"
#define LOG(SEVERITY) ptyspawn::log::SEVERITY("system/UnixProcess")

namespace ptyspawn::system
{

std::unique_ptr<Process> Process::spawn(const Command& Cmd,
                                        std::shared_ptr<Pty> PTY)
{
  return unix::Process::launch(Cmd, std::move(PTY));
}

namespace unix
{

namespace
{

/// A \p nullptr terminated array of C strings, as \p exec() expects it.
class CStringArray
{
public:
  explicit CStringArray(std::vector<std::string> Strings)
    : Storage(std::move(Strings))
  {
    Pointers.reserve(Storage.size() + 1);
    for (std::string& S : Storage)
      Pointers.push_back(S.data());
    Pointers.push_back(nullptr);
  }

  CStringArray(const CStringArray&) = delete;
  CStringArray& operator=(const CStringArray&) = delete;

  [[nodiscard]] char** get() noexcept { return Pointers.data(); }

private:
  std::vector<std::string> Storage;
  std::vector<char*> Pointers;
};

/// Everything the child needs between \p fork() and \p exec(), prepared in
/// advance.
struct ChildSetup
{
  const char* Program;
  char** Argv;
  char** Envp;
  const char* WorkingDirectory;
  fd::raw_fd Slave;
  fd::raw_fd StatusPipe;
  bool NewSession;
  bool ControllingTerminal;
  bool SearchPath;
};

/// Writes \p Errno to the status pipe and terminates the child.
[[noreturn]] void reportAndExit(fd::raw_fd StatusPipe, int Errno) noexcept
{
  // Nothing is left to report to if this write fails.
  [[maybe_unused]] ssize_t Written =
    ::write(StatusPipe, &Errno, sizeof(Errno));
  ::_exit(127);
}

/// Executed in the child after \p fork(). Only async-signal-safe calls are
/// allowed here, as the parent might have been multi-threaded.
[[noreturn]] void execInChild(const ChildSetup& S) noexcept
{
  if (S.NewSession)
  {
    if (::setsid() == -1)
      reportAndExit(S.StatusPipe, errno);
    if (S.ControllingTerminal && ::ioctl(S.Slave, TIOCSCTTY, 0) == -1)
      reportAndExit(S.StatusPipe, errno);
  }

  for (fd::raw_fd Std : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO})
    if (::dup2(S.Slave, Std) == -1)
      reportAndExit(S.StatusPipe, errno);

  if (S.WorkingDirectory && ::chdir(S.WorkingDirectory) == -1)
    reportAndExit(S.StatusPipe, errno);

  // exec() keeps the signal mask and the ignored signals.
  sigset_t Empty;
  ::sigemptyset(&Empty);
  if (::sigprocmask(SIG_SETMASK, &Empty, nullptr) == -1)
    reportAndExit(S.StatusPipe, errno);
  struct ::sigaction Default = {};
  Default.sa_handler = SIG_DFL;
  for (int Sig = 1; Sig < NSIG; ++Sig)
  {
    if (Sig == SIGKILL || Sig == SIGSTOP)
      continue;
    // Signals reserved by the C library are rejected with EINVAL.
    [[maybe_unused]] int Reset = ::sigaction(Sig, &Default, nullptr);
  }

  if (S.SearchPath)
    ::execvpe(S.Program, S.Argv, S.Envp);
  else
    ::execve(S.Program, S.Argv, S.Envp);
  reportAndExit(S.StatusPipe, errno);
}

/// Collects the terminated child \p PID.
ExitOutcome collect(Process::Raw PID)
{
  int WaitStatus = 0;
  auto Reaped = CheckedErrnoRetry(
    [PID, &WaitStatus] { return ::waitpid(PID, &WaitStatus, 0); }, -1);
  if (!Reaped)
    throw std::system_error{Reaped.getError(),
                            "waitpid(" + std::to_string(PID) + ")"};

  PTYSPAWN_TRACE_LOG(LOG(trace) << "Successfully reaped child PID " << PID);
  if (WIFEXITED(WaitStatus))
    return ExitOutcome::exited(WEXITSTATUS(WaitStatus));
  if (WIFSIGNALED(WaitStatus))
    return ExitOutcome::signalled(WTERMSIG(WaitStatus));
  unreachable("waitpid() without WUNTRACED reported a non-terminal state");
}

std::error_code sendSignal(Process::Raw PID, int Signal)
{
  PTYSPAWN_TRACE_LOG(LOG(trace)
                     << "Sending signal " << Signal << " to PID " << PID);
  auto Sent = CheckedErrno([PID, Signal] { return ::kill(PID, Signal); }, -1);
  return Sent.getError();
}

/// Kills and collects a child that could not be started properly.
void abandon(Process::Raw PID, bool Running)
{
  if (Running)
  {
    std::error_code EC = sendSignal(PID, SIGKILL);
    if (EC)
      LOG(error) << "Killing PID " << PID << " failed: " << EC.message();
  }

  try
  {
    ExitOutcome O = collect(PID);
    LOG(debug) << "Abandoned PID " << PID << ": " << O.describe();
  }
  catch (const std::system_error& Err)
  {
    LOG(error) << "Collecting abandoned PID " << PID << ": " << Err.what();
  }
}

ProcessMonitor::Actions monitorActions(Process::Raw PID,
                                       std::shared_ptr<system::Pty> PTY)
{
  ProcessMonitor::Actions Act;
  Act.AwaitExit = [PID] {
    ::siginfo_t Info = {};
    auto Waited = CheckedErrnoRetry(
      [PID, &Info] {
        return ::waitid(P_PID, PID, &Info, WEXITED | WNOWAIT);
      },
      -1);
    return Waited.getError();
  };
  Act.Collect = [PID] { return collect(PID); };
  Act.Terminate = [PID] { return sendSignal(PID, SIGKILL); };
  Act.Teardown = [PTY = std::move(PTY)] { return PTY->childExited(); };
  return Act;
}

} // namespace

Process::Process(Raw PID, std::shared_ptr<system::Pty> PTY)
  : system::Process(PID, std::move(PTY))
{}

Process::~Process() noexcept { shutdown(); }

std::error_code Process::signal(int Signal)
{
  return Monitor->whileRunning(
    [this, Signal] { return sendSignal(Handle, Signal); });
}

std::unique_ptr<Process> Process::launch(const Command& Cmd,
                                         std::shared_ptr<system::Pty> PTY)
{
  Cmd.validate();
  if (!PTY)
    throw LaunchError{std::make_error_code(std::errc::invalid_argument),
                      "exec: " + Cmd.Program + ": no terminal to attach to"};
  if (!PTY->isOpen() || !PTY->slave().isOpen())
    throw ClosedError{"exec: " + Cmd.Program + ": terminal"};

  Command::Attributes Attrs =
    Cmd.PlatformAttributes.value_or(Command::Attributes{});
  CStringArray Argv{Cmd.Arguments};
  CStringArray Envp{
    childEnvironment(Cmd.Environment, Cmd.CaseSensitiveEnvironment)};
  auto [StatusRead, StatusWrite] = fd::pipe();

  // The child dup2()s the slave over the standard streams, so neither of the
  // descriptors it needs may be a standard stream itself. This happens if the
  // current process runs with some of them closed.
  fd::raw_fd Slave = PTY->slave().raw();
  fd LiftedSlave;
  if (Slave <= STDERR_FILENO)
  {
    LiftedSlave = fd::duplicateAbove(Slave, STDERR_FILENO);
    Slave = LiftedSlave.get();
  }
  if (StatusWrite.get() <= STDERR_FILENO)
    StatusWrite = fd::duplicateAbove(StatusWrite.get(), STDERR_FILENO);

  ChildSetup Setup;
  Setup.Program = Cmd.Program.c_str();
  Setup.Argv = Argv.get();
  Setup.Envp = Envp.get();
  Setup.WorkingDirectory =
    Cmd.WorkingDirectory.empty() ? nullptr : Cmd.WorkingDirectory.c_str();
  Setup.Slave = Slave;
  Setup.StatusPipe = StatusWrite.get();
  Setup.NewSession = Attrs.NewSession;
  Setup.ControllingTerminal = Attrs.ControllingTerminal;
  Setup.SearchPath = Cmd.Program.find('/') == std::string::npos;

  LOG(debug) << "Spawning '" << Cmd.Program << "' on " << PTY->slave().name();
  for (std::size_t I = 0; I < Cmd.Arguments.size(); ++I)
    PTYSPAWN_TRACE_LOG(LOG(data) << "    Arg " << I << ": " << Cmd.Arguments[I]);

  Raw PID =
    CheckedErrnoThrow<LaunchError>([] { return ::fork(); }, "fork()", -1);
  if (PID == 0)
    execInChild(Setup);

  StatusWrite.reset();
  LiftedSlave.reset();

  int ChildErrno = 0;
  auto Status = CheckedErrnoRetry(
    [RawFD = StatusRead.get(), &ChildErrno] {
      return ::read(RawFD, &ChildErrno, sizeof(ChildErrno));
    },
    -1);
  if (!Status)
  {
    abandon(PID, true);
    throw LaunchError{Status.getError(), "exec: " + Cmd.Program};
  }
  if (Status.get() != 0)
  {
    abandon(PID, false);
    std::error_code EC =
      Status.get() == sizeof(ChildErrno)
        ? std::error_code{ChildErrno, std::generic_category()}
        : std::make_error_code(std::errc::io_error);
    LOG(debug) << "Starting '" << Cmd.Program << "' failed: " << EC.message();
    throw LaunchError{EC, "exec: " + Cmd.Program};
  }

  LOG(debug) << "PID " << PID << " spawned.";
  auto P = std::make_unique<Process>(PID, PTY);

  std::error_code SlaveError = PTY->releaseSlave();
  if (SlaveError)
    LOG(warn) << "Releasing the slave side failed: " << SlaveError.message();

  P->startMonitor(monitorActions(PID, std::move(PTY)), Cmd.Cancel);
  return P;
}

} // namespace unix
} // namespace ptyspawn::system

#undef LOG
