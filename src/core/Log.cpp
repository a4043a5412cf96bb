/* SPDX-License-Identifier: LGPL-3.0-only */
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

#include "ptyspawn/Log.hpp"

namespace ptyspawn::log
{

// clang-format off
static constexpr const char* SeverityName[Min + 1] = {"           ",
                                                      "!!! FATAL  ",
                                                      " !! ERROR  ",
                                                      "  ! Warning",
                                                      "    Info   ",
                                                      "  > Debug  ",
                                                      " >> trace  ",
                                                      ">>> data   "};
static constexpr const char InvalidSeverity[] =       "??? Invalid";
// clang-format on

static std::string formatNow()
{
  std::time_t RawTime =
    std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm SplitTime{};
#ifdef _WIN32
  (void)::localtime_s(&SplitTime, &RawTime);
#else
  (void)::localtime_r(&RawTime, &SplitTime);
#endif

  std::ostringstream Buf;
  Buf << std::put_time(&SplitTime, "%Y-%m-%d %H:%M:%S");
  return Buf.str();
}

/// Reads the initial severity limit from the environment, if one is set.
static Severity initialLimit()
{
  // Not using system::getEnv() here, as that would log.
  const char* Value = std::getenv(Logger::LevelEnvironmentVariable);
  if (!Value || !*Value)
    return Default;

  char* End = nullptr;
  long Parsed = std::strtol(Value, &End, 10);
  if (*End != '\0')
    return Default;
  if (Parsed < Max)
    return Max;
  if (Parsed > Min)
    return Min;
  return static_cast<Severity>(Parsed);
}

const char* Logger::levelName(Severity S) noexcept
{
  if (S > log::Min || S < log::Max)
    return InvalidSeverity;
  return SeverityName[S];
}

Logger::OutputBuffer::OutputBuffer(std::ostream& OS,
                                   std::mutex& Lock,
                                   bool Discard,
                                   std::string_view Prefix)
  : Discard(Discard), OS(&OS), Lock(&Lock)
{
  if (!Discard)
    Buffer << Prefix;
}

Logger::OutputBuffer::~OutputBuffer() noexcept(false)
{
  if (Discard)
    return;

  std::lock_guard<std::mutex> L{*Lock};
  (*OS) << Buffer.str() << std::endl;
}

Logger& Logger::get()
{
  static Logger Singleton{initialLimit(), std::clog};
  return Singleton;
}

Logger::Logger(Severity S, std::ostream& OS) : SeverityLimit(S), OS(&OS) {}

Logger::OutputBuffer Logger::operator()(Severity S, std::string_view Facility)
{
  std::ostringstream LogPrefix;
  bool Discarding = S > getLimit();
  if (!Discarding)
  {
    LogPrefix << '[' << formatNow() << ']';
    LogPrefix << '[' << levelName(S) << ']' << ' ';
    if (!Facility.empty())
      LogPrefix << Facility;
    else
      LogPrefix << "<Unknown>";
    LogPrefix << ':' << ' ';
  }

  std::lock_guard<std::mutex> L{Lock};
  return OutputBuffer{*OS, Lock, Discarding, LogPrefix.str()};
}

} // namespace ptyspawn::log
