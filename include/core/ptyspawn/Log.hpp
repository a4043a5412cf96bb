/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <sstream>
#include <string_view>

#include "ptyspawn/Config.h"

namespace ptyspawn::log
{

/// Severity levels for log messages.
/// Severities linearly increase in "verbosity" level, so a lower severity
/// \e number indicate a higher severity of the message.
enum Severity
{
  /// The highest severity level. Will always be printed, no matter what.
  None = 0,
  /// Critical messages that are likely the last printout from the system.
  Fatal,
  /// Errors indicate operation failures which can be recovered from without
  /// exploding, but the operation itself cannot meaningfully continue.
  Error,
  /// Warnings indicate oopsies in operation which can be recovered from fully.
  Warning,
  /// The standard log level.
  Info,
  /// Debug information are meaningful only when trying to diagnose bogus
  /// behaviour, like a child that never seems to exit.
  Debug,
  /// Verbose debug information that creates a printout at every lifecycle
  /// transition of a terminal pair or a process.
  Trace,
  /// The most verbose debug information which also prints raw handle values.
  Data,

  /// The default severity level for bare printouts when a severity is not
  /// specified.
  Default = Warning,

  /// The largest severity value.
  Max = None,
  /// The lowest severity value.
  Min = Data,
};

/// The \p Logger class handles emitting log messages to an output device.
///
/// Every message is assembled in a private buffer and written to the output
/// device in one piece under a lock, so the waiter threads of the processes
/// may log concurrently with the client.
class Logger
{
private:
  class OutputBuffer
  {
    bool Discard;
    std::ostream* OS;
    std::mutex* Lock;
    std::ostringstream Buffer;

  public:
    /// Wraps an output device into a log buffer.
    ///
    /// \param Discard Whether to throw the logged data away.
    OutputBuffer(std::ostream& OS,
                 std::mutex& Lock,
                 bool Discard,
                 std::string_view Prefix);

    /// Print the contents of the log buffer to the output device.
    ~OutputBuffer() noexcept(false);

    /// Print the contents of the fed value to the internal buffer.
    template <typename T> OutputBuffer& operator<<(T&& Value)
    {
      if (!Discard)
        Buffer << std::forward<T>(Value);
      return *this;
    }
  };

public:
  /// The environment variable that, if set to a number, overrides the initial
  /// severity limit of the global instance.
  static constexpr char LevelEnvironmentVariable[] = "PTYSPAWN_LOG_LEVEL";

  /// \returns a human-readable tag for the specified severity.
  static const char* levelName(Severity S) noexcept;

  /// Retrieve the logging instance for the current application.
  static Logger& get();

  /// Creates a new \p Logger object that has no connection with the global
  /// logging instance.
  ///
  /// \note In most of the cases, you do not want to do this.
  ///
  /// \see get()
  Logger(Severity SeverityLimit, std::ostream& OS);

  [[nodiscard]] Severity getLimit() const noexcept
  {
    return SeverityLimit.load();
  }
  void setLimit(Severity Limit) noexcept { SeverityLimit.store(Limit); }

  /// Redirects all log messages after the call to this function to another
  /// output device.
  void setOutput(std::ostream& OS) noexcept
  {
    std::lock_guard<std::mutex> L{Lock};
    this->OS = &OS;
  }

  /// Starts printing a log message with the specified \p S severity.
  /// If the \p S severity is lower than the current severity limit, the message
  /// will be discarded.
  OutputBuffer operator()(Severity S, std::string_view Facility);

private:
  std::atomic<Severity> SeverityLimit;
  std::ostream* OS;
  std::mutex Lock;
};

#define PTYSPAWN_LOGGER_SHORTCUT(NAME, SEVERITY)                               \
  inline decltype(auto) NAME(std::string_view Facility)                        \
  {                                                                            \
    return ptyspawn::log::Logger::get()(SEVERITY, Facility);                   \
  }

PTYSPAWN_LOGGER_SHORTCUT(always, None);
PTYSPAWN_LOGGER_SHORTCUT(log, Default);

PTYSPAWN_LOGGER_SHORTCUT(fatal, Fatal);
PTYSPAWN_LOGGER_SHORTCUT(error, Error);
PTYSPAWN_LOGGER_SHORTCUT(warn, Warning);
PTYSPAWN_LOGGER_SHORTCUT(info, Info);
PTYSPAWN_LOGGER_SHORTCUT(debug, Debug);
PTYSPAWN_LOGGER_SHORTCUT(trace, Trace);
PTYSPAWN_LOGGER_SHORTCUT(data, Data);

#undef PTYSPAWN_LOGGER_SHORTCUT

#if PTYSPAWN_NON_ESSENTIAL_LOGS
/* Wrap logging code into this macro to suppress building it if config option
 * \p PTYSPAWN_NON_ESSENTIAL_LOGS is turned off.
 */
#define PTYSPAWN_TRACE_LOG(X)                                                  \
  do                                                                           \
  {                                                                            \
    X;                                                                         \
  } while (false)
#else
#define PTYSPAWN_TRACE_LOG(X) ((void)0)
#endif

} // namespace ptyspawn::log
