/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <system_error>

#include "ptyspawn/Error.hpp"

namespace ptyspawn::system
{

/// Serialises the operations on a platform resource with its teardown, and
/// ensures that the teardown happens exactly once.
///
/// The lifecycle moves monotonically from \p Open through \p Closing to
/// \p Closed, visiting every state at most once.
class LifecycleGuard
{
public:
  enum class State
  {
    /// The resource is alive and can be operated on.
    Open,
    /// The teardown of the resource is in progress.
    Closing,
    /// The teardown finished, the resource is released.
    Closed
  };

  /// The platform-level teardown action. Returns the error of the teardown,
  /// if any.
  using DestroyFn = std::function<std::error_code()>;

  LifecycleGuard() = default;
  LifecycleGuard(const LifecycleGuard&) = delete;
  LifecycleGuard& operator=(const LifecycleGuard&) = delete;

  [[nodiscard]] State state() const;

  /// Tears the resource down by executing \p Destroy, unless it is already
  /// torn down.
  ///
  /// \returns an empty error code if the state was \p Closed already.
  /// If the teardown is in progress on another thread, blocks until it
  /// finishes, and returns the result of that teardown.
  /// Otherwise executes \p Destroy without holding the lock (so it may
  /// block without stalling the observers) and returns its result.
  ///
  /// \note If \p Destroy throws an \p std::system_error, its code is the
  /// result. Any other exception is propagated, but the state still reaches
  /// \p Closed.
  std::error_code close(const DestroyFn& Destroy);

  /// Executes \p F while holding the lock, but only if the resource is
  /// \p Open.
  ///
  /// \throws ClosedError if the resource is being or had been torn down.
  template <typename Fn> decltype(auto) withOpen(Fn&& F, const char* What)
  {
    std::lock_guard<std::mutex> L{Lock};
    if (Current != State::Open)
      throw ClosedError{std::string{What} + ": file already closed"};
    return F();
  }

private:
  mutable std::mutex Lock;
  std::condition_variable Transition;
  State Current = State::Open;
  std::error_code Result;
};

} // namespace ptyspawn::system
