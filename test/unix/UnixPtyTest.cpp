/* SPDX-License-Identifier: GPL-3.0-only */
#include <string>

#include <fcntl.h>

#include <gtest/gtest.h>

#include "ptyspawn/Error.hpp"
#include "ptyspawn/PtySpawn.hpp"
#include "ptyspawn/system/UnixPty.hpp"
#include "ptyspawn/system/fd.hpp"

/* NOLINTBEGIN(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */

using namespace ptyspawn;
using namespace ptyspawn::system;

namespace
{

/// Reads from \p E until at least \p Bytes arrived, or the stream ended.
std::string readAtLeast(Endpoint& E, std::size_t Bytes)
{
  std::string Data;
  while (Data.size() < Bytes)
  {
    std::string Chunk = E.read(Bytes - Data.size());
    if (Chunk.empty())
      break;
    Data.append(Chunk);
  }
  return Data;
}

bool isCloseOnExec(Handle::Raw FD)
{
  int Flags = ::fcntl(FD, F_GETFD);
  return Flags != -1 && (Flags & FD_CLOEXEC);
}

} // namespace

TEST(UnixPty, EndpointNames)
{
  auto P = open();
  EXPECT_EQ(P->master().name(), "/dev/ptmx");
  EXPECT_EQ(P->slave().name().rfind("/dev/pts/", 0), 0U) << P->slave().name();
  EXPECT_GE(P->master().raw(), 0);
  EXPECT_GE(P->slave().raw(), 0);
  EXPECT_EQ(P->master().owner(), P.get());
  EXPECT_EQ(P->slave().owner(), P.get());
}

TEST(UnixPty, DescriptorsAreNotInherited)
{
  auto P = open();
  EXPECT_TRUE(isCloseOnExec(P->master().raw()));
  EXPECT_TRUE(isCloseOnExec(P->slave().raw()));
}

TEST(UnixPty, SlaveOutputArrivesOnMaster)
{
  auto P = open();
  P->slave().writeAll("out\n");
  // The default line discipline translates the newline.
  EXPECT_EQ(readAtLeast(P->master(), 5), "out\r\n");
}

TEST(UnixPty, MasterInputArrivesOnSlave)
{
  auto P = open();
  P->master().writeAll("in\n");
  EXPECT_EQ(readAtLeast(P->slave(), 3), "in\n");
}

TEST(UnixPty, SetAndGetSize)
{
  auto P = open();
  setSize(P->master(), 24, 80);
  Pty::Size S = getSizeFull(P->master());
  EXPECT_EQ(S.Rows, 24);
  EXPECT_EQ(S.Columns, 80);

  P->setSize(40, 120);
  S = getSizeFull(P->slave());
  EXPECT_EQ(S.Rows, 40);
  EXPECT_EQ(S.Columns, 120);
}

TEST(UnixPty, MasterReportsEndOfStreamWithoutSlave)
{
  auto P = open();
  EXPECT_FALSE(P->releaseSlave());
  EXPECT_FALSE(P->slave().isOpen());
  EXPECT_TRUE(P->isOpen());

  EXPECT_EQ(P->master().read(16), "");
}

TEST(UnixPty, OperationsAfterCloseFail)
{
  auto P = open();
  EXPECT_FALSE(P->close());
  EXPECT_EQ(P->state(), LifecycleGuard::State::Closed);
  EXPECT_FALSE(P->close());
  EXPECT_FALSE(P->master().close());

  try
  {
    setSize(P->master(), 24, 80);
    FAIL() << "setSize() should have thrown";
  }
  catch (const ClosedError& E)
  {
    EXPECT_EQ(E.code(), errc::closed);
  }
  EXPECT_THROW((void)getSizeFull(P->master()), ClosedError);
  EXPECT_THROW((void)P->master().read(1), ClosedError);
  EXPECT_THROW((void)P->slave().write("x"), ClosedError);
}

TEST(UnixPty, ClosingMasterClosesThePair)
{
  auto P = open();
  EXPECT_FALSE(P->master().close());
  EXPECT_FALSE(P->isOpen());
  EXPECT_FALSE(P->slave().isOpen());
}

TEST(UnixPty, WindowSizeOfNonTerminal)
{
  auto Pipe = unix::fd::pipe();
  try
  {
    unix::Pty::setWindowSize(Pipe.first.get(), Pty::Size{24, 80});
    FAIL() << "setWindowSize() should have thrown";
  }
  catch (const NotAPtyError& E)
  {
    EXPECT_EQ(E.code(), errc::not_a_pty);
  }
  EXPECT_THROW((void)unix::Pty::getWindowSize(Pipe.first.get()),
               NotAPtyError);
}

/* NOLINTEND(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */
