/* SPDX-License-Identifier: LGPL-3.0-only */
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <unordered_map>
#include <utility>

#include "ptyspawn/system/Platform.hpp"

#include "ptyspawn/system/Environment.hpp"

#ifdef _WIN32
#include <stdlib.h>
#define PTYSPAWN_ENVIRON _environ
#else
extern "C" char** environ; // NOLINT(readability-identifier-naming)
#define PTYSPAWN_ENVIRON environ
#endif

#include "ptyspawn/Log.hpp"
#define LOG(SEVERITY) ptyspawn::log::SEVERITY("system/Environment")

namespace ptyspawn::system
{

static std::string toLower(std::string_view Str)
{
  std::string R{Str};
  std::transform(R.begin(), R.end(), R.begin(), [](unsigned char Ch) {
    return static_cast<char>(std::tolower(Ch));
  });
  return R;
}

std::string getEnv(const std::string& Key)
{
  std::optional<std::string> Value = lookupEnv(Key);
  return Value ? std::move(*Value) : std::string{};
}

std::optional<std::string> lookupEnv(const std::string& Key)
{
  const char* const Value = std::getenv(Key.c_str());
  if (!Value)
  {
    PTYSPAWN_TRACE_LOG(LOG(data) << "getEnv(" << Key << ") -> unset");
    return std::nullopt;
  }
  PTYSPAWN_TRACE_LOG(LOG(data) << "getEnv(" << Key << ") = " << Value);
  return std::string{Value};
}

std::vector<std::string> currentEnvironment()
{
  std::vector<std::string> R;
  for (char** Entry = PTYSPAWN_ENVIRON; Entry && *Entry; ++Entry)
    R.emplace_back(*Entry);
  return R;
}

std::string_view environmentKey(std::string_view Entry) noexcept
{
  std::size_t Equals = Entry.find('=');
  if (Equals == std::string_view::npos)
    return {};
  return Entry.substr(0, Equals);
}

std::vector<std::string> dedupEnvironment(const std::vector<std::string>& Entries,
                                          bool CaseInsensitive)
{
  std::vector<std::string> Out;
  Out.reserve(Entries.size());
  std::unordered_map<std::string, std::size_t> Seen;

  for (const std::string& Entry : Entries)
  {
    if (Entry.find('=') == std::string::npos)
    {
      Out.push_back(Entry);
      continue;
    }

    std::string_view RawKey = environmentKey(Entry);
    std::string Key = CaseInsensitive ? toLower(RawKey) : std::string{RawKey};
    auto It = Seen.find(Key);
    if (It != Seen.end())
    {
      PTYSPAWN_TRACE_LOG(LOG(trace) << "Environment entry '" << Out[It->second]
                                    << "' overridden by '" << Entry << '\'');
      Out[It->second] = Entry;
      continue;
    }

    Seen.try_emplace(std::move(Key), Out.size());
    Out.push_back(Entry);
  }
  return Out;
}

std::vector<std::string>
addMandatoryEnvironment(std::vector<std::string> Entries,
                        const std::vector<std::string>& MandatoryKeys)
{
  for (const std::string& Mandatory : MandatoryKeys)
  {
    std::string WantedKey = toLower(Mandatory);
    bool Present =
      std::any_of(Entries.begin(), Entries.end(), [&](const std::string& E) {
        return E.find('=') != std::string::npos &&
               toLower(environmentKey(E)) == WantedKey;
      });
    if (Present)
      continue;

    LOG(debug) << "Adding missing mandatory variable " << Mandatory
               << " to the environment";
    Entries.push_back(Mandatory + '=' + getEnv(Mandatory));
  }
  return Entries;
}

std::vector<std::string>
childEnvironment(const std::optional<std::vector<std::string>>& Requested,
                 bool CaseSensitive)
{
  std::vector<std::string> Base =
    Requested ? *Requested : currentEnvironment();
  return addMandatoryEnvironment(dedupEnvironment(Base, !CaseSensitive),
                                 Platform::mandatoryEnvironment());
}

} // namespace ptyspawn::system

#undef PTYSPAWN_ENVIRON
#undef LOG
