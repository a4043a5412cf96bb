/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ptyspawn::system
{

/// \returns the value of the environment variable \p Key.
///
/// \note This function is a safe alternative to \p getenv() as it immediately
/// allocates a \e new string with the result.
[[nodiscard]] std::string getEnv(const std::string& Key);

/// \returns the value of the environment variable \p Key, or \p std::nullopt
/// if it is not set at all.
[[nodiscard]] std::optional<std::string> lookupEnv(const std::string& Key);

/// \returns the environment of the current process, as \p KEY=VALUE strings.
[[nodiscard]] std::vector<std::string> currentEnvironment();

/// \returns the key part of a \p KEY=VALUE environment entry, or the empty
/// view if the entry contains no \p '='.
[[nodiscard]] std::string_view environmentKey(std::string_view Entry) noexcept;

/// Resolves duplicate keys in \p Entries. A later occurrence of a key wins, but
/// it stays at the position where the key first appeared. Entries without a
/// \p '=' are kept verbatim.
///
/// \param CaseInsensitive If set, \p PATH and \p Path are the same key.
[[nodiscard]] std::vector<std::string>
dedupEnvironment(const std::vector<std::string>& Entries, bool CaseInsensitive);

/// Appends the \p MandatoryKeys that are not present in \p Entries (compared
/// case-insensitively), with the value taken from the current process.
[[nodiscard]] std::vector<std::string>
addMandatoryEnvironment(std::vector<std::string> Entries,
                        const std::vector<std::string>& MandatoryKeys);

/// Creates the environment that a child process started with the
/// \p Requested environment should receive. If \p Requested is not set, the
/// child inherits the environment of the current process.
[[nodiscard]] std::vector<std::string>
childEnvironment(const std::optional<std::vector<std::string>>& Requested,
                 bool CaseSensitive);

} // namespace ptyspawn::system
