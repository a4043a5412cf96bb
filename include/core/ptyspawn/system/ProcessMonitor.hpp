/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>

#include "ptyspawn/system/ExitOutcome.hpp"

namespace ptyspawn::system
{

/// Observes the termination of a single child process on a dedicated waiter
/// thread.
///
/// The waiter thread is the only one that ever issues the blocking wait on
/// the process. Every observer reads the cached \p ExitOutcome once it is
/// published, so any number of concurrent \p wait() calls see the same
/// result.
class ProcessMonitor
{
public:
  /// The platform-specific actions the monitor drives.
  struct Actions
  {
    /// Blocks until the process terminates, \b without collecting it, so the
    /// process identifier can not be recycled yet.
    std::function<std::error_code()> AwaitExit;
    /// Collects the terminated process and converts its exit status. Called
    /// under the monitor's lock, after which the process identifier is
    /// invalid.
    std::function<ExitOutcome()> Collect;
    /// Forcefully terminates the process. Only called under the monitor's lock
    /// while the process is not yet collected.
    std::function<std::error_code()> Terminate;
    /// Tears down the resources tied to the life of the process, after it was
    /// collected.
    std::function<std::error_code()> Teardown;
  };

  ProcessMonitor(std::string Identifier, Actions Act);
  ProcessMonitor(const ProcessMonitor&) = delete;
  ProcessMonitor& operator=(const ProcessMonitor&) = delete;

  /// Waits for the waiter thread to finish.
  ~ProcessMonitor() noexcept;

  /// Starts the waiter thread.
  void start();

  /// Blocks until the outcome is published.
  ///
  /// \returns the outcome, which is the same object for every caller.
  const ExitOutcome& wait();

  /// \returns whether the outcome had been published.
  [[nodiscard]] bool finished() const;

  /// \returns whether the process had been collected.
  [[nodiscard]] bool exited() const;

  /// Forcefully terminates the process, unless it was already collected.
  /// Killing an exited process is a no-op that reports success.
  std::error_code kill();

  /// Executes \p Action under the monitor's lock, but only if the process was
  /// not yet collected, guaranteeing that a recycled process identifier is
  /// never targeted.
  std::error_code whileRunning(const std::function<std::error_code()>& Action);

  /// Waits for the waiter thread to finish.
  void join();

private:
  void run() noexcept;

  std::string Identifier;
  Actions Act;

  mutable std::mutex Lock;
  std::condition_variable Published;
  bool Exited = false;
  bool Done = false;
  ExitOutcome Outcome;

  std::thread Waiter;
};

} // namespace ptyspawn::system
