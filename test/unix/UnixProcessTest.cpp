/* SPDX-License-Identifier: GPL-3.0-only */
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <csignal>
#include <cstdio>

#include <fcntl.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "ptyspawn/Error.hpp"
#include "ptyspawn/PtySpawn.hpp"
#include "ptyspawn/adt/scope_guard.hpp"
#include "ptyspawn/system/UnixProcess.hpp"

/* NOLINTBEGIN(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */

using namespace ptyspawn;
using namespace ptyspawn::system;

namespace
{

Command shell(const std::string& Script)
{
  return Command::create("/bin/sh", {"-c", Script});
}

/// Reads everything the child wrote, until the terminal reports the end of
/// the stream.
std::string readAll(Endpoint& E)
{
  std::string Data;
  while (true)
  {
    std::string Chunk = E.read(BUFSIZ);
    if (Chunk.empty())
      break;
    Data.append(Chunk);
  }
  return Data;
}

} // namespace

TEST(UnixProcess, EchoReachesMaster)
{
  Spawned S = start(Command::create("echo", {"hello"}));
  ASSERT_NE(S.Child, nullptr);
  EXPECT_GT(S.Child->raw(), 0);
  EXPECT_FALSE(S.PTY->slave().isOpen());

  EXPECT_EQ(readAll(S.PTY->master()), "hello\r\n");
  const ExitOutcome& Exit = S.Child->wait();
  EXPECT_TRUE(Exit.succeeded()) << Exit.describe();
  EXPECT_EQ(Exit.exitCode(), 0);
  EXPECT_TRUE(S.Child->dead());
  EXPECT_NO_THROW(Exit.check());

  EXPECT_FALSE(S.PTY->close());
}

TEST(UnixProcess, OutputReadableAfterExit)
{
  Spawned S = start(shell("echo done"));
  EXPECT_TRUE(S.Child->wait().succeeded());
  EXPECT_EQ(readAll(S.PTY->master()), "done\r\n");
}

TEST(UnixProcess, ChildSeesSlaveAsControllingTerminal)
{
  Spawned S = start(shell("tty"));
  std::string SlaveName = S.PTY->slave().name();
  EXPECT_EQ(readAll(S.PTY->master()), SlaveName + "\r\n");
  EXPECT_TRUE(S.Child->wait().succeeded());
}

TEST(UnixProcess, InitialSizeIsObservedByChild)
{
  Spawned S = start(shell("stty size"), {withInitialSize(33, 99)});
  EXPECT_EQ(readAll(S.PTY->master()), "33 99\r\n");
  EXPECT_TRUE(S.Child->wait().succeeded());
}

TEST(UnixProcess, ResizeWhileRunning)
{
  Spawned S = start(Command::create("sleep", {"30"}));

  setSize(S.PTY->master(), 24, 80);
  Pty::Size Size = getSizeFull(S.PTY->master());
  EXPECT_EQ(Size.Rows, 24);
  EXPECT_EQ(Size.Columns, 80);

  setSize(S.PTY->master(), 40, 120);
  Size = getSizeFull(S.PTY->master());
  EXPECT_EQ(Size.Rows, 40);
  EXPECT_EQ(Size.Columns, 120);

  EXPECT_FALSE(S.Child->kill());
  EXPECT_EQ(S.Child->wait().signal(), SIGKILL);
}

TEST(UnixProcess, CancellationKillsChild)
{
  CancellationSource Source;
  Command Cmd = Command::create("sleep", {"30"});
  Cmd.Cancel = Source.token();

  Spawned S = start(Cmd);
  EXPECT_FALSE(S.Child->dead());
  EXPECT_TRUE(Source.cancel());

  const ExitOutcome& Exit = S.Child->wait();
  EXPECT_TRUE(Exit.failed());
  EXPECT_TRUE(Exit.exitedAbnormally());
  EXPECT_EQ(Exit.signal(), SIGKILL);
  EXPECT_EQ(Exit.exitCode(), -1);
  EXPECT_THROW(Exit.check(), ProcessExitError);

  EXPECT_FALSE(S.PTY->close());
}

TEST(UnixProcess, AlreadyCancelledTokenKillsChild)
{
  CancellationSource Source;
  Source.cancel();
  Command Cmd = Command::create("sleep", {"30"});
  Cmd.Cancel = Source.token();

  Spawned S = start(Cmd);
  EXPECT_EQ(S.Child->wait().signal(), SIGKILL);
}

TEST(UnixProcess, ConcurrentWaitersSeeExitCode)
{
  Spawned S = start(shell("sleep 0.2; exit 3"));

  constexpr std::size_t Waiters = 8;
  std::vector<const ExitOutcome*> Seen(Waiters, nullptr);
  std::vector<std::thread> Threads;
  for (std::size_t I = 0; I < Waiters; ++I)
    Threads.emplace_back([&S, &Seen, I] { Seen.at(I) = &S.Child->wait(); });
  for (std::thread& T : Threads)
    T.join();

  for (const ExitOutcome* Exit : Seen)
  {
    ASSERT_NE(Exit, nullptr);
    EXPECT_EQ(Exit, Seen.front());
    EXPECT_EQ(Exit->exitCode(), 3);
    EXPECT_TRUE(Exit->failed());
  }
  EXPECT_EQ(Seen.front()->describe(), "exit status 3");
}

TEST(UnixProcess, KillAfterExitIsNoop)
{
  Spawned S = start(Command::create("true"));
  EXPECT_TRUE(S.Child->wait().succeeded());
  EXPECT_FALSE(S.Child->kill());
  EXPECT_TRUE(S.Child->wait().succeeded());
}

TEST(UnixProcess, SignalIsDelivered)
{
  Spawned S = start(Command::create("sleep", {"30"}));
  auto* Child = dynamic_cast<unix::Process*>(S.Child.get());
  ASSERT_NE(Child, nullptr);

  EXPECT_FALSE(Child->signal(SIGTERM));
  EXPECT_EQ(S.Child->wait().signal(), SIGTERM);
  EXPECT_FALSE(Child->signal(SIGTERM));
}

TEST(UnixProcess, StandardStreamsClosedInParent)
{
  // With stdin and stdout closed, the pair is allocated onto descriptors 0
  // and 1.
  int SavedIn = ::fcntl(STDIN_FILENO, F_DUPFD_CLOEXEC, STDERR_FILENO + 1);
  int SavedOut = ::fcntl(STDOUT_FILENO, F_DUPFD_CLOEXEC, STDERR_FILENO + 1);
  ASSERT_NE(SavedIn, -1);
  ASSERT_NE(SavedOut, -1);

  std::string Output;
  std::string SlaveName;
  ExitOutcome Exit;
  {
    scope_guard Restore{[SavedIn, SavedOut] {
      ::dup2(SavedIn, STDIN_FILENO);
      ::dup2(SavedOut, STDOUT_FILENO);
      ::close(SavedIn);
      ::close(SavedOut);
    }};
    ::close(STDIN_FILENO);
    ::close(STDOUT_FILENO);

    Spawned S = start(shell("echo hello; tty"));
    SlaveName = S.PTY->slave().name();
    Output = readAll(S.PTY->master());
    Exit = S.Child->wait();
    EXPECT_FALSE(S.PTY->close());
  }

  EXPECT_EQ(Output, "hello\r\n" + SlaveName + "\r\n");
  EXPECT_TRUE(Exit.succeeded()) << Exit.describe();
}

TEST(UnixProcess, MissingExecutable)
{
  try
  {
    (void)start(Command::create("/nonexistent/ptyspawn-no-such-program"));
    FAIL() << "start() should have thrown";
  }
  catch (const LaunchError& E)
  {
    EXPECT_EQ(E.code(), std::make_error_code(std::errc::no_such_file_or_directory));
  }

  EXPECT_THROW(
    (void)start(Command::create("ptyspawn-no-such-program-on-path")),
    LaunchError);
}

TEST(UnixProcess, FailedLaunchKeepsPairUsable)
{
  auto P = open();
  EXPECT_THROW(
    (void)Process::spawn(Command::create("/nonexistent/ptyspawn"), P),
    LaunchError);
  EXPECT_TRUE(P->isOpen());
  EXPECT_TRUE(P->slave().isOpen());

  auto Child = Process::spawn(shell("echo again"), P);
  EXPECT_EQ(readAll(P->master()), "again\r\n");
  EXPECT_TRUE(Child->wait().succeeded());
}

TEST(UnixProcess, EmptyCommandIsRejected)
{
  Command Cmd;
  try
  {
    (void)start(Cmd);
    FAIL() << "start() should have thrown";
  }
  catch (const LaunchError& E)
  {
    EXPECT_EQ(E.code(), std::make_error_code(std::errc::invalid_argument));
  }
}

TEST(UnixProcess, SpawnOnClosedPair)
{
  auto P = open();
  EXPECT_FALSE(P->close());
  EXPECT_THROW((void)Process::spawn(shell("true"), P), ClosedError);
}

TEST(UnixProcess, EnvironmentIsDeduplicated)
{
  Command Cmd = shell("echo \"$foo:$FOO:$BAR\"");
  Cmd.Environment = std::vector<std::string>{"FOO=1", "foo=2", "BAR=x"};

  Spawned S = start(Cmd);
  EXPECT_EQ(readAll(S.PTY->master()), "2::x\r\n");
  EXPECT_TRUE(S.Child->wait().succeeded());
}

TEST(UnixProcess, CaseSensitiveEnvironment)
{
  Command Cmd = shell("echo \"$foo:$FOO\"");
  Cmd.Environment = std::vector<std::string>{"FOO=1", "foo=2"};
  Cmd.CaseSensitiveEnvironment = true;

  Spawned S = start(Cmd);
  EXPECT_EQ(readAll(S.PTY->master()), "2:1\r\n");
  EXPECT_TRUE(S.Child->wait().succeeded());
}

TEST(UnixProcess, WorkingDirectory)
{
  Command Cmd = shell("pwd");
  Cmd.WorkingDirectory = "/";

  Spawned S = start(Cmd);
  EXPECT_EQ(readAll(S.PTY->master()), "/\r\n");
  EXPECT_TRUE(S.Child->wait().succeeded());
}

TEST(UnixProcess, MissingWorkingDirectory)
{
  Command Cmd = shell("true");
  Cmd.WorkingDirectory = "/nonexistent/ptyspawn";
  try
  {
    (void)start(Cmd);
    FAIL() << "start() should have thrown";
  }
  catch (const LaunchError& E)
  {
    EXPECT_EQ(E.code(), std::make_error_code(std::errc::no_such_file_or_directory));
  }
}

TEST(UnixProcess, DestroyingProcessKillsChild)
{
  Spawned S = start(Command::create("sleep", {"30"}));
  auto Begin = std::chrono::steady_clock::now();
  S.Child.reset();
  EXPECT_LT(std::chrono::steady_clock::now() - Begin, std::chrono::seconds(10));

  // With the child gone, the master reaches the end of the stream.
  EXPECT_EQ(readAll(S.PTY->master()), "");
}

/* NOLINTEND(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */
