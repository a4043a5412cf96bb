/* SPDX-License-Identifier: GPL-3.0-only */
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "ptyspawn/Error.hpp"
#include "ptyspawn/PtySpawn.hpp"
#include "ptyspawn/system/LifecycleGuard.hpp"
#include "ptyspawn/system/Pty.hpp"

/* NOLINTBEGIN(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */

using namespace ptyspawn;
using namespace ptyspawn::system;

namespace
{

class FakeEndpoint : public system::Endpoint
{
public:
  FakeEndpoint(std::string Name, std::atomic<int>& Closes)
    : system::Endpoint(std::move(Name)), Closes(Closes)
  {}

  [[nodiscard]] Handle::Raw raw() const noexcept override
  {
    return PlatformSpecificHandleTraits::Invalid;
  }

protected:
  std::size_t readImpl(char* /* Buffer */, std::size_t /* Size */) override
  {
    return 0;
  }
  std::size_t writeImpl(const char* /* Buffer */, std::size_t Size) override
  {
    return Size;
  }
  std::error_code closeImpl() noexcept override
  {
    ++Closes;
    return {};
  }

private:
  std::atomic<int>& Closes;
};

/// A terminal pair that counts how many times its platform resource would be
/// released.
class FakePty : public system::Pty
{
public:
  std::atomic<int> Destroys{0};
  std::atomic<int> EndpointCloses{0};
  std::chrono::milliseconds DestroyDelay{0};
  std::atomic<int>* ExternalDestroys = nullptr;
  std::error_code DestroyResult;
  Size Current;
  /// Counts the releases of the session that both the child exit and the
  /// teardown may release.
  std::atomic<int> SessionReleases{0};

  FakePty()
  {
    adopt(std::make_unique<FakeEndpoint>("fake-master", EndpointCloses),
          std::make_unique<FakeEndpoint>("fake-slave", EndpointCloses));
  }
  ~FakePty() noexcept override { closeOnDestruction(); }

  std::error_code childExited() override
  {
    releaseSession();
    return {};
  }

protected:
  std::error_code destroy() override
  {
    releaseSession();
    ++Destroys;
    if (ExternalDestroys)
      ++*ExternalDestroys;
    std::this_thread::sleep_for(DestroyDelay);
    std::error_code MasterError = closeEndpoint(master());
    std::error_code SlaveError = closeEndpoint(slave());
    if (DestroyResult)
      return DestroyResult;
    return MasterError ? MasterError : SlaveError;
  }
  void setSizeImpl(Size S) override { Current = S; }
  Size getSizeImpl() override { return Current; }

private:
  std::mutex SessionLock;
  bool SessionOpen = true;

  void releaseSession() noexcept
  {
    bool WasOpen = false;
    {
      std::lock_guard<std::mutex> L{SessionLock};
      std::swap(WasOpen, SessionOpen);
    }
    if (WasOpen)
      ++SessionReleases;
  }
};

} // namespace

TEST(LifecycleGuard, MovesFromOpenToClosed)
{
  LifecycleGuard G;
  EXPECT_EQ(G.state(), LifecycleGuard::State::Open);
  EXPECT_EQ(G.withOpen([] { return 42; }, "test"), 42);

  int Destroys = 0;
  EXPECT_FALSE(G.close([&Destroys] {
    ++Destroys;
    return std::error_code{};
  }));
  EXPECT_EQ(G.state(), LifecycleGuard::State::Closed);
  EXPECT_EQ(Destroys, 1);

  EXPECT_FALSE(G.close([&Destroys] {
    ++Destroys;
    return std::make_error_code(std::errc::io_error);
  }));
  EXPECT_EQ(Destroys, 1);
}

TEST(LifecycleGuard, OperationsAfterCloseFail)
{
  LifecycleGuard G;
  (void)G.close([] { return std::error_code{}; });

  try
  {
    G.withOpen([] {}, "setsize");
    FAIL() << "withOpen() should have thrown";
  }
  catch (const ClosedError& E)
  {
    EXPECT_EQ(E.code(), errc::closed);
  }
}

TEST(LifecycleGuard, ThrowingTeardownStillCloses)
{
  LifecycleGuard G;
  std::error_code EC = G.close([]() -> std::error_code {
    throw std::system_error{std::make_error_code(std::errc::io_error),
                            "teardown"};
  });
  EXPECT_EQ(EC, std::errc::io_error);
  EXPECT_EQ(G.state(), LifecycleGuard::State::Closed);
}

TEST(LifecycleGuard, ConcurrentCloseTearsDownOnce)
{
  FakePty P;
  P.DestroyDelay = std::chrono::milliseconds(50);
  P.DestroyResult = std::make_error_code(std::errc::io_error);

  constexpr std::size_t Threads = 8;
  std::vector<std::error_code> Results(Threads);
  std::vector<std::thread> Closers;
  for (std::size_t I = 0; I < Threads; ++I)
    Closers.emplace_back([&P, &Results, I] { Results[I] = P.close(); });
  for (std::thread& T : Closers)
    T.join();

  EXPECT_EQ(P.Destroys.load(), 1);
  EXPECT_EQ(P.state(), LifecycleGuard::State::Closed);

  // The closer that did the teardown and the ones that waited for it see the
  // error, the ones arriving after it see a successful no-op.
  std::size_t Failed = 0;
  for (const std::error_code& EC : Results)
    if (EC)
    {
      EXPECT_EQ(EC, std::errc::io_error);
      ++Failed;
    }
  EXPECT_GE(Failed, 1U);
}

TEST(LifecycleGuard, ChildExitRacingCloseReleasesOnce)
{
  FakePty P;
  P.DestroyDelay = std::chrono::milliseconds(20);

  constexpr std::size_t Threads = 8;
  std::atomic<bool> Go{false};
  std::vector<std::error_code> Results(Threads);
  std::error_code ExitResult = std::make_error_code(std::errc::io_error);
  std::vector<std::thread> Workers;
  for (std::size_t I = 0; I < Threads; ++I)
    Workers.emplace_back([&P, &Go, &Results, I] {
      while (!Go.load())
        std::this_thread::yield();
      Results[I] = P.close();
    });
  Workers.emplace_back([&P, &Go, &ExitResult] {
    while (!Go.load())
      std::this_thread::yield();
    ExitResult = P.childExited();
  });
  Go.store(true);
  for (std::thread& T : Workers)
    T.join();

  EXPECT_EQ(P.SessionReleases.load(), 1);
  EXPECT_EQ(P.Destroys.load(), 1);
  EXPECT_EQ(P.state(), LifecycleGuard::State::Closed);
  EXPECT_FALSE(ExitResult);
  for (const std::error_code& EC : Results)
    EXPECT_FALSE(EC) << EC.message();
}

TEST(Pty, CloseIsIdempotent)
{
  FakePty P;
  EXPECT_TRUE(P.isOpen());
  EXPECT_FALSE(P.close());
  EXPECT_FALSE(P.close());
  EXPECT_EQ(P.Destroys.load(), 1);
  EXPECT_EQ(P.EndpointCloses.load(), 2);
  EXPECT_FALSE(P.master().isOpen());
  EXPECT_FALSE(P.slave().isOpen());
}

TEST(Pty, ResizeAfterCloseFails)
{
  FakePty P;
  P.setSize(24, 80);
  EXPECT_EQ(P.getSize().Rows, 24);
  EXPECT_EQ(P.getSize().Columns, 80);

  (void)P.close();
  EXPECT_THROW(P.setSize(40, 120), ClosedError);
  EXPECT_THROW((void)P.getSize(), ClosedError);
}

TEST(Pty, ClosingMasterClosesThePair)
{
  FakePty P;
  EXPECT_FALSE(P.master().close());
  EXPECT_EQ(P.Destroys.load(), 1);
  EXPECT_FALSE(P.isOpen());
  EXPECT_FALSE(P.slave().isOpen());
}

TEST(Pty, ClosingSlaveKeepsThePair)
{
  FakePty P;
  EXPECT_FALSE(P.slave().close());
  EXPECT_FALSE(P.slave().close());
  EXPECT_EQ(P.EndpointCloses.load(), 1);
  EXPECT_EQ(P.Destroys.load(), 0);
  EXPECT_TRUE(P.isOpen());
  EXPECT_TRUE(P.master().isOpen());
}

TEST(Pty, EndpointIOAfterCloseFails)
{
  FakePty P;
  EXPECT_EQ(P.master().write("abc"), 3U);
  EXPECT_EQ(P.master().read(16), "");

  (void)P.close();
  try
  {
    (void)P.master().read(16);
    FAIL() << "read() should have thrown";
  }
  catch (const ClosedError& E)
  {
    EXPECT_EQ(E.code(), errc::closed);
  }
  EXPECT_THROW((void)P.master().write("abc"), ClosedError);
}

TEST(Pty, DestructionTearsDown)
{
  std::atomic<int> Destroys{0};
  {
    FakePty Closed;
    Closed.ExternalDestroys = &Destroys;
    (void)Closed.close();
    EXPECT_EQ(Destroys.load(), 1);
  }
  EXPECT_EQ(Destroys.load(), 1);

  {
    FakePty Unclosed;
    Unclosed.ExternalDestroys = &Destroys;
    Unclosed.setSize(10, 10);
  }
  EXPECT_EQ(Destroys.load(), 2);
}

TEST(Pty, FacadeResizesThroughEndpoint)
{
  FakePty P;
  setSize(P.master(), 33, 99);
  Pty::Size S = getSizeFull(P.slave());
  EXPECT_EQ(S.Rows, 33);
  EXPECT_EQ(S.Columns, 99);
}

TEST(Pty, FacadeRejectsUnownedEndpoint)
{
  std::atomic<int> Closes{0};
  FakeEndpoint Loose{"loose", Closes};

  try
  {
    setSize(Loose, 24, 80);
    FAIL() << "setSize() should have thrown";
  }
  catch (const NotAPtyError& E)
  {
    EXPECT_EQ(E.code(), errc::not_a_pty);
  }
  EXPECT_THROW((void)getSizeFull(Loose), NotAPtyError);
}

/* NOLINTEND(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */
