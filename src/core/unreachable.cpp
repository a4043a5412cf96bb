/* SPDX-License-Identifier: LGPL-3.0-only */
#include <cstdlib>

#include "ptyspawn/unreachable.hpp"

#include "ptyspawn/Log.hpp"
#define LOG(SEVERITY) ptyspawn::log::SEVERITY("unreachable")

namespace ptyspawn::detail
{

[[noreturn]] void
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
unreachable_impl(const char* Msg, const char* File, std::size_t LineNo)
{
  {
    auto Out = LOG(fatal);
    Out << "Reached an unreachable point at " << File << ':' << LineNo;
    if (Msg)
      Out << ": " << Msg;
  }
  std::abort();
}

} // namespace ptyspawn::detail

#undef LOG
