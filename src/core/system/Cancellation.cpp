/* SPDX-License-Identifier: LGPL-3.0-only */
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

#include "ptyspawn/adt/scope_guard.hpp"

#include "ptyspawn/system/Cancellation.hpp"

#include "ptyspawn/Log.hpp"
#define LOG(SEVERITY) ptyspawn::log::SEVERITY("system/Cancellation")

namespace ptyspawn::system
{

namespace detail
{

struct CancellationState
{
  std::mutex Lock;
  std::condition_variable CallbackFinished;
  bool Cancelled = false;
  std::uint64_t NextID = 1;
  std::map<std::uint64_t, std::function<void()>> Callbacks;

  /// The thread executing the callbacks, once cancellation was requested.
  std::thread::id CancellingThread;
  /// The registration whose callback is executing right now.
  std::optional<std::uint64_t> Running;
};

} // namespace detail

CancellationToken::Registration::Registration(
  std::shared_ptr<detail::CancellationState> State, std::uint64_t ID) noexcept
  : State(std::move(State)), ID(ID)
{}

CancellationToken::Registration::Registration(Registration&& RHS) noexcept
  : State(std::move(RHS.State)), ID(RHS.ID)
{
  RHS.ID = 0;
}

CancellationToken::Registration&
CancellationToken::Registration::operator=(Registration&& RHS) noexcept
{
  if (this == &RHS)
    return *this;
  deregister();
  State = std::move(RHS.State);
  ID = RHS.ID;
  RHS.ID = 0;
  return *this;
}

CancellationToken::Registration::~Registration() noexcept { deregister(); }

bool CancellationToken::Registration::active() const noexcept
{
  if (!State)
    return false;
  std::lock_guard<std::mutex> L{State->Lock};
  return State->Callbacks.find(ID) != State->Callbacks.end();
}

void CancellationToken::Registration::deregister() noexcept
{
  if (!State)
    return;

  std::unique_lock<std::mutex> L{State->Lock};
  if (State->Callbacks.erase(ID) == 0 && State->Running == ID &&
      State->CancellingThread != std::this_thread::get_id())
  {
    PTYSPAWN_TRACE_LOG(LOG(trace) << "Registration #" << ID
                                  << " waiting for its running callback...");
    State->CallbackFinished.wait(L, [this] { return State->Running != ID; });
  }

  L.unlock();
  State.reset();
  ID = 0;
}

CancellationToken::CancellationToken(
  std::shared_ptr<detail::CancellationState> State) noexcept
  : State(std::move(State))
{}

bool CancellationToken::cancelled() const noexcept
{
  if (!State)
    return false;
  std::lock_guard<std::mutex> L{State->Lock};
  return State->Cancelled;
}

CancellationToken::Registration
CancellationToken::onCancel(std::function<void()> Callback) const
{
  if (!State)
    return {};

  {
    std::lock_guard<std::mutex> L{State->Lock};
    if (!State->Cancelled)
    {
      std::uint64_t ID = State->NextID++;
      State->Callbacks.emplace(ID, std::move(Callback));
      return Registration{State, ID};
    }
  }

  PTYSPAWN_TRACE_LOG(LOG(trace) << "Already cancelled, firing immediately.");
  Callback();
  return {};
}

CancellationSource::CancellationSource()
  : State(std::make_shared<detail::CancellationState>())
{}

CancellationToken CancellationSource::token() const noexcept
{
  return CancellationToken{State};
}

bool CancellationSource::cancel()
{
  std::unique_lock<std::mutex> L{State->Lock};
  if (State->Cancelled)
    return false;

  State->Cancelled = true;
  State->CancellingThread = std::this_thread::get_id();
  LOG(debug) << "Cancellation requested, " << State->Callbacks.size()
             << " callback(s) pending";

  while (!State->Callbacks.empty())
  {
    auto It = State->Callbacks.begin();
    std::function<void()> Callback = std::move(It->second);
    State->Running = It->first;
    State->Callbacks.erase(It);
    L.unlock();

    scope_guard Finished{[this, &L] {
      L.lock();
      State->Running.reset();
      State->CallbackFinished.notify_all();
    }};
    Callback();
  }
  return true;
}

bool CancellationSource::cancelled() const noexcept
{
  std::lock_guard<std::mutex> L{State->Lock};
  return State->Cancelled;
}

} // namespace ptyspawn::system

#undef LOG
