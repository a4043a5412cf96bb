/* SPDX-License-Identifier: GPL-3.0-only */
#include <gtest/gtest.h>

#include "ptyspawn/Error.hpp"
#include "ptyspawn/PtySpawn.hpp"
#include "ptyspawn/system/ConsoleApi.hpp"
#include "ptyspawn/system/Win32Pty.hpp"

/* NOLINTBEGIN(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */

using namespace ptyspawn;
using namespace ptyspawn::system;

#define REQUIRE_PSEUDO_CONSOLE                                                 \
  if (!win32::ConsoleApi::get().available())                                   \
  GTEST_SKIP() << "Pseudo consoles are not supported on this host."

TEST(Win32Pty, EndpointNames)
{
  REQUIRE_PSEUDO_CONSOLE;
  auto P = open();
  EXPECT_EQ(P->master().name(), "");
  EXPECT_EQ(P->slave().name(), "windows-pty");
  EXPECT_NE(P->master().raw(), nullptr);
  EXPECT_EQ(P->master().raw(), P->slave().raw());
}

TEST(Win32Pty, DefaultSize)
{
  REQUIRE_PSEUDO_CONSOLE;
  auto P = open();
  Pty::Size S = getSizeFull(P->master());
  EXPECT_EQ(S.Rows, win32::Pty::DefaultSize.Rows);
  EXPECT_EQ(S.Columns, win32::Pty::DefaultSize.Columns);
}

TEST(Win32Pty, SetAndGetSize)
{
  REQUIRE_PSEUDO_CONSOLE;
  auto P = open();
  setSize(P->master(), 24, 80);
  Pty::Size S = getSizeFull(P->master());
  EXPECT_EQ(S.Rows, 24);
  EXPECT_EQ(S.Columns, 80);

  setSize(P->master(), 40, 120);
  S = getSizeFull(P->slave());
  EXPECT_EQ(S.Rows, 40);
  EXPECT_EQ(S.Columns, 120);
}

TEST(Win32Pty, OversizedResizeIsRejected)
{
  REQUIRE_PSEUDO_CONSOLE;
  auto P = open();
  setSize(P->master(), 24, 80);

  try
  {
    setSize(P->master(), 40000, 80);
    FAIL() << "setSize() should have thrown";
  }
  catch (const RuntimeIOError& E)
  {
    EXPECT_EQ(E.code(), std::errc::invalid_argument);
  }
  EXPECT_THROW(setSize(P->master(), 24, 65535), RuntimeIOError);

  Pty::Size S = getSizeFull(P->master());
  EXPECT_EQ(S.Rows, 24);
  EXPECT_EQ(S.Columns, 80);
}

TEST(Win32Pty, ResizeAfterChildExitFails)
{
  REQUIRE_PSEUDO_CONSOLE;
  auto P = std::make_shared<win32::Pty>();
  EXPECT_FALSE(P->childExited());
  EXPECT_TRUE(P->isOpen());
  EXPECT_THROW(P->setSize(24, 80), ClosedError);
}

TEST(Win32Pty, RawHandleGoneAfterChildExit)
{
  REQUIRE_PSEUDO_CONSOLE;
  auto P = std::make_shared<win32::Pty>();
  ASSERT_NE(P->master().raw(), nullptr);
  EXPECT_EQ(P->master().raw(), P->session());

  EXPECT_FALSE(P->childExited());
  EXPECT_EQ(P->session(), nullptr);
  EXPECT_EQ(P->master().raw(), nullptr);
  EXPECT_EQ(P->slave().raw(), nullptr);
  EXPECT_FALSE(P->close());
}

TEST(Win32Pty, OperationsAfterCloseFail)
{
  REQUIRE_PSEUDO_CONSOLE;
  auto P = open();
  EXPECT_FALSE(P->close());
  EXPECT_FALSE(P->close());

  try
  {
    setSize(P->master(), 24, 80);
    FAIL() << "setSize() should have thrown";
  }
  catch (const ClosedError& E)
  {
    EXPECT_EQ(E.code(), errc::closed);
  }
  EXPECT_THROW((void)P->master().read(1), ClosedError);
}

/* NOLINTEND(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */
