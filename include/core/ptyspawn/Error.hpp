/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <string>
#include <system_error>

namespace ptyspawn
{

/// Error conditions reported by the library itself, as opposed to the
/// operating system. Values of this enum compare equal to the \p code() of the
/// exceptions thrown with them.
enum class errc
{
  /// The platform, or the feature requested, is not available on this host.
  unsupported = 1,
  /// The handle passed to a terminal operation does not belong to a pty.
  not_a_pty,
  /// The operation requires a resource that had already been torn down.
  closed,
  /// The child process terminated with a failure.
  process_failed,
};

/// \returns the category object of \p ptyspawn::errc values.
const std::error_category& error_category() noexcept;

// NOLINTNEXTLINE(readability-identifier-naming)
inline std::error_code make_error_code(errc E) noexcept
{
  return {static_cast<int>(E), error_category()};
}

/// The base class of every exception the library throws.
class Error : public std::system_error
{
public:
  Error(std::error_code EC, const std::string& What)
    : std::system_error(EC, What)
  {}
};

/// The platform failed to create the endpoint pair or the console session.
class AllocationError : public Error
{
public:
  using Error::Error;
};

/// Starting the child process failed: executable lookup, permissions, or the
/// attachment of the terminal to the new process.
class LaunchError : public Error
{
public:
  using Error::Error;
};

/// A read or write on a live endpoint failed.
class RuntimeIOError : public Error
{
public:
  using Error::Error;
};

/// An operation was attempted on a terminal pair or endpoint after teardown.
class ClosedError : public Error
{
public:
  explicit ClosedError(const std::string& What)
    : Error(make_error_code(errc::closed), What)
  {}
};

/// The feature or the platform capability is absent on the current host.
class UnsupportedError : public Error
{
public:
  explicit UnsupportedError(const std::string& What)
    : Error(make_error_code(errc::unsupported), What)
  {}
};

/// A terminal operation was requested on something that is not a pty.
class NotAPtyError : public Error
{
public:
  explicit NotAPtyError(const std::string& What)
    : Error(make_error_code(errc::not_a_pty), What)
  {}
};

/// The child process terminated abnormally. Carries the exit status.
class ProcessExitError : public Error
{
public:
  ProcessExitError(int ExitCode, int Signal, const std::string& What)
    : Error(make_error_code(errc::process_failed), What), ExitCode(ExitCode),
      Signal(Signal)
  {}

  /// \returns the exit code of the process, or \p -1 if it was killed.
  [[nodiscard]] int exitCode() const noexcept { return ExitCode; }
  /// \returns the signal that terminated the process, or \p 0 if it exited.
  [[nodiscard]] int signal() const noexcept { return Signal; }

private:
  int ExitCode;
  int Signal;
};

} // namespace ptyspawn

namespace std
{

template <> struct is_error_code_enum<ptyspawn::errc> : true_type
{};

} // namespace std
