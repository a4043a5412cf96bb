/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <string>
#include <system_error>

namespace ptyspawn::system
{

/// The result of the life of a child process, as observed by its monitor.
///
/// An abnormal exit of the child (non-zero exit code, or termination by a
/// signal) is kept apart from the infrastructure failures (the wait itself, or
/// the teardown of the terminal pair failed).
class ExitOutcome
{
public:
  enum class Status
  {
    /// The process had not been observed to terminate yet.
    Pending,
    /// The process exited with \p 0 and no infrastructure failure happened.
    Succeeded,
    /// Anything else.
    Failed
  };

  /// Creates a \p Pending outcome.
  ExitOutcome() noexcept = default;

  /// The process exited on its own with \p Code.
  [[nodiscard]] static ExitOutcome exited(int Code) noexcept;
  /// The process was terminated by \p Signal.
  [[nodiscard]] static ExitOutcome signalled(int Signal) noexcept;
  /// Observing the termination of the process failed.
  [[nodiscard]] static ExitOutcome waitFailed(std::error_code Error) noexcept;

  /// \returns a copy of the outcome that also carries the failure of the
  /// teardown that followed the termination. The teardown error is only kept
  /// if the process itself succeeded.
  [[nodiscard]] ExitOutcome
  withTeardownError(std::error_code Error) const noexcept;

  [[nodiscard]] Status status() const noexcept;
  [[nodiscard]] bool pending() const noexcept { return !Terminated && !Error; }
  [[nodiscard]] bool succeeded() const noexcept
  {
    return status() == Status::Succeeded;
  }
  [[nodiscard]] bool failed() const noexcept
  {
    return status() == Status::Failed;
  }

  /// \returns whether the child process itself terminated abnormally.
  [[nodiscard]] bool exitedAbnormally() const noexcept
  {
    return Terminated && (Code != 0 || Signal != 0);
  }

  /// \returns the exit code of the process, or \p -1 if it was killed by a
  /// signal or had not terminated.
  [[nodiscard]] int exitCode() const noexcept;
  /// \returns the signal that terminated the process, or \p 0.
  [[nodiscard]] int signal() const noexcept { return Signal; }
  /// \returns the infrastructure failure that accompanied the outcome.
  [[nodiscard]] std::error_code error() const noexcept { return Error; }

  /// Formats the outcome for humans, e.g. "exit status 3".
  [[nodiscard]] std::string describe() const;

  /// Turns the outcome into an exception, if it is a failure.
  ///
  /// \throws ProcessExitError if the child terminated abnormally.
  /// \throws Error with the infrastructure failure, if any.
  void check() const;

  friend bool operator==(const ExitOutcome& LHS,
                         const ExitOutcome& RHS) noexcept
  {
    return LHS.Terminated == RHS.Terminated && LHS.Code == RHS.Code &&
           LHS.Signal == RHS.Signal && LHS.Error == RHS.Error;
  }
  friend bool operator!=(const ExitOutcome& LHS,
                         const ExitOutcome& RHS) noexcept
  {
    return !(LHS == RHS);
  }

private:
  bool Terminated = false;
  int Code = 0;
  int Signal = 0;
  std::error_code Error;
};

} // namespace ptyspawn::system
