/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cstdint>
#include <functional>
#include <memory>

namespace ptyspawn::system
{

namespace detail
{
struct CancellationState;
} // namespace detail

/// A read-only view of the cancellation state of a \p CancellationSource.
///
/// A default-constructed token is not connected to any source and can never be
/// cancelled.
class CancellationToken
{
public:
  /// Keeps a callback registered with \p onCancel() alive. Destroying the
  /// registration removes the callback. If the callback is executing on
  /// another thread at that moment, the destructor waits for it to finish.
  class Registration
  {
  public:
    Registration() noexcept = default;
    Registration(Registration&& RHS) noexcept;
    Registration& operator=(Registration&& RHS) noexcept;
    ~Registration() noexcept;

    Registration(const Registration&) = delete;
    Registration& operator=(const Registration&) = delete;

    /// \returns whether the callback is still registered and pending.
    [[nodiscard]] bool active() const noexcept;

  private:
    friend class CancellationToken;
    Registration(std::shared_ptr<detail::CancellationState> State,
                 std::uint64_t ID) noexcept;

    void deregister() noexcept;

    std::shared_ptr<detail::CancellationState> State;
    std::uint64_t ID = 0;
  };

  CancellationToken() noexcept = default;

  /// \returns whether the token is connected to a source.
  [[nodiscard]] bool cancellable() const noexcept
  {
    return static_cast<bool>(State);
  }

  /// \returns whether cancellation had been requested on the source.
  [[nodiscard]] bool cancelled() const noexcept;

  /// Registers \p Callback to run when cancellation is requested. The callback
  /// runs on the thread that calls \p CancellationSource::cancel(). If
  /// cancellation had already been requested, \p Callback is executed
  /// immediately, on the calling thread, and the returned registration is
  /// inactive.
  [[nodiscard]] Registration onCancel(std::function<void()> Callback) const;

private:
  friend class CancellationSource;
  explicit CancellationToken(
    std::shared_ptr<detail::CancellationState> State) noexcept;

  std::shared_ptr<detail::CancellationState> State;
};

/// The owning side of a cancellation signal.
class CancellationSource
{
public:
  CancellationSource();

  /// \returns a token observing this source.
  [[nodiscard]] CancellationToken token() const noexcept;

  /// Requests cancellation and executes every registered callback, in the
  /// order they were registered.
  ///
  /// \returns \p true if this call was the one that requested cancellation.
  bool cancel();

  /// \returns whether cancellation had been requested.
  [[nodiscard]] bool cancelled() const noexcept;

private:
  std::shared_ptr<detail::CancellationState> State;
};

} // namespace ptyspawn::system
