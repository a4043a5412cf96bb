/* SPDX-License-Identifier: LGPL-3.0-only */
#include <utility>

#include "ptyspawn/system/ProcessMonitor.hpp"

#include "ptyspawn/Log.hpp"
#define LOG(SEVERITY) ptyspawn::log::SEVERITY("system/ProcessMonitor")
#define LOG_WITH_IDENTIFIER(SEVERITY) LOG(SEVERITY) << Identifier << ": "

namespace ptyspawn::system
{

ProcessMonitor::ProcessMonitor(std::string Identifier, Actions Act)
  : Identifier(std::move(Identifier)), Act(std::move(Act))
{}

ProcessMonitor::~ProcessMonitor() noexcept { join(); }

void ProcessMonitor::start()
{
  PTYSPAWN_TRACE_LOG(LOG_WITH_IDENTIFIER(trace) << "Starting waiter...");
  Waiter = std::thread{[this] { run(); }};
}

void ProcessMonitor::run() noexcept
{
  ExitOutcome Result;
  try
  {
    std::error_code WaitError = Act.AwaitExit();

    {
      std::lock_guard<std::mutex> L{Lock};
      Exited = true;
      if (WaitError)
      {
        LOG_WITH_IDENTIFIER(error) << "Waiting failed: " << WaitError.message();
        Result = ExitOutcome::waitFailed(WaitError);
      }
      else
        Result = Act.Collect();
    }
    LOG_WITH_IDENTIFIER(debug) << "Terminated: " << Result.describe();

    if (Act.Teardown)
    {
      std::error_code TeardownError = Act.Teardown();
      if (TeardownError)
      {
        LOG_WITH_IDENTIFIER(warn)
          << "Teardown after exit failed: " << TeardownError.message();
        Result = Result.withTeardownError(TeardownError);
      }
    }
  }
  catch (const std::system_error& Err)
  {
    LOG_WITH_IDENTIFIER(error) << "Monitoring failed: " << Err.what();
    std::lock_guard<std::mutex> L{Lock};
    Exited = true;
    Result = ExitOutcome::waitFailed(Err.code());
  }

  std::lock_guard<std::mutex> L{Lock};
  Outcome = Result;
  Done = true;
  Published.notify_all();
}

const ExitOutcome& ProcessMonitor::wait()
{
  std::unique_lock<std::mutex> L{Lock};
  Published.wait(L, [this] { return Done; });
  return Outcome;
}

bool ProcessMonitor::finished() const
{
  std::lock_guard<std::mutex> L{Lock};
  return Done;
}

bool ProcessMonitor::exited() const
{
  std::lock_guard<std::mutex> L{Lock};
  return Exited;
}

std::error_code ProcessMonitor::kill()
{
  return whileRunning([this] {
    LOG_WITH_IDENTIFIER(debug) << "Killing...";
    return Act.Terminate();
  });
}

std::error_code
ProcessMonitor::whileRunning(const std::function<std::error_code()>& Action)
{
  std::lock_guard<std::mutex> L{Lock};
  if (Exited)
  {
    PTYSPAWN_TRACE_LOG(LOG_WITH_IDENTIFIER(trace)
                       << "Already exited, nothing to do.");
    return {};
  }
  return Action();
}

void ProcessMonitor::join()
{
  if (!Waiter.joinable())
    return;
  if (Waiter.get_id() == std::this_thread::get_id())
    // Destroyed from one of the actions, the thread ends right after.
    Waiter.detach();
  else
    Waiter.join();
}

} // namespace ptyspawn::system

#undef LOG_WITH_IDENTIFIER
#undef LOG
