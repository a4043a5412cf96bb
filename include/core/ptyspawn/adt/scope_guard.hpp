/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <utility>

namespace ptyspawn
{

namespace detail
{
inline void noEnter() noexcept {}
} // namespace detail

/// A simple scope guard that fires an optional callback function when it is
/// constructed, and another callback function (usually, a lambda passed to the
/// constructor) when destructed.
///
/// Examples:
///
///   \code{.cpp}
///   scope_guard Cleanup{[] { exit(); }};
///   \endcode
///
///   \code{.cpp}
///   scope_guard RAII{[] { enter(); }, [] { exit(); }};
///   \endcode
///
/// The exit callback can be turned off with \p dismiss(), which is useful for
/// rolling back a partially done operation only on the error path.
template <typename EnterFunction, typename ExitFunction> struct scope_guard
{
  // NOLINTNEXTLINE(google-explicit-constructor)
  scope_guard(ExitFunction&& Exit) noexcept
    : Alive(true), Exit(std::forward<ExitFunction>(Exit))
  {}
  scope_guard(EnterFunction&& Enter,
              ExitFunction&& Exit) noexcept(noexcept(Enter()))
    : Alive(false), Exit(std::forward<ExitFunction>(Exit))
  {
    Enter();
    Alive = true; // NOLINT(cppcoreguidelines-prefer-member-initializer)
  }

  ~scope_guard() noexcept(noexcept(std::declval<ExitFunction&>()()))
  {
    if (Alive)
      Exit();
    Alive = false;
  }

  /// Disarms the guard: the exit callback will not fire.
  void dismiss() noexcept { Alive = false; }

  scope_guard() = delete;
  scope_guard(const scope_guard&) = delete;
  scope_guard(scope_guard&&) = delete;
  scope_guard& operator=(const scope_guard&) = delete;
  scope_guard& operator=(scope_guard&&) = delete;

private:
  bool Alive;
  ExitFunction Exit;
};

template <typename ExitFunction>
scope_guard(ExitFunction&&)
  -> scope_guard<decltype(&detail::noEnter), ExitFunction>;

template <typename EnterFunction, typename ExitFunction>
scope_guard(EnterFunction&&, ExitFunction&&)
  -> scope_guard<EnterFunction, ExitFunction>;

} // namespace ptyspawn
