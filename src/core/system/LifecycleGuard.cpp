/* SPDX-License-Identifier: LGPL-3.0-only */
#include "ptyspawn/adt/scope_guard.hpp"

#include "ptyspawn/system/LifecycleGuard.hpp"

#include "ptyspawn/Log.hpp"
#define LOG(SEVERITY) ptyspawn::log::SEVERITY("system/LifecycleGuard")

namespace ptyspawn::system
{

LifecycleGuard::State LifecycleGuard::state() const
{
  std::lock_guard<std::mutex> L{Lock};
  return Current;
}

std::error_code LifecycleGuard::close(const DestroyFn& Destroy)
{
  std::unique_lock<std::mutex> L{Lock};
  switch (Current)
  {
    case State::Closed:
      PTYSPAWN_TRACE_LOG(LOG(trace) << "Already closed.");
      return {};
    case State::Closing:
      PTYSPAWN_TRACE_LOG(LOG(trace) << "Teardown in flight, waiting...");
      Transition.wait(L, [this] { return Current == State::Closed; });
      return Result;
    case State::Open:
      break;
  }

  Current = State::Closing;
  L.unlock();

  std::error_code EC;
  scope_guard Finish{[this, &EC] {
    std::lock_guard<std::mutex> G{Lock};
    Current = State::Closed;
    Result = EC;
    Transition.notify_all();
  }};

  try
  {
    EC = Destroy();
  }
  catch (const std::system_error& Err)
  {
    LOG(error) << "Teardown failed: " << Err.what();
    EC = Err.code();
  }

  if (EC)
    LOG(warn) << "Teardown reported error: " << EC.message();
  return EC;
}

} // namespace ptyspawn::system

#undef LOG
