/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cstddef>

namespace ptyspawn::detail
{

/// Reports a broken internal invariant through the \p Fatal log, and aborts.
[[noreturn]] void
// NOLINTNEXTLINE(readability-identifier-naming)
unreachable_impl(const char* Msg, const char* File, std::size_t LineNo);

} // namespace ptyspawn::detail

/// Marks a point of the code that the operating system's contract guarantees
/// is never reached.
#define unreachable(MSG)                                                       \
  ::ptyspawn::detail::unreachable_impl(MSG, __FILE__, __LINE__)
