/* SPDX-License-Identifier: LGPL-3.0-only */
#include "ptyspawn/system/Handle.hpp"

#include "ptyspawn/Log.hpp"
#define LOG(SEVERITY) ptyspawn::log::SEVERITY("system/Handle")

namespace ptyspawn::system
{

Handle::Handle(Raw Value) noexcept : Value(Value)
{
  PTYSPAWN_TRACE_LOG(LOG(data) << "Handle #" << to_string()
                               << " owned by instance.");
}

Handle Handle::wrap(Raw Value) noexcept
{
  PTYSPAWN_TRACE_LOG(LOG(data) << "Handle #"
                               << PlatformSpecificHandleTraits::to_string(Value)
                               << " wrapped.");
  return Handle{Value};
}

Handle::~Handle() noexcept { reset(); }

std::error_code Handle::close() noexcept
{
  if (!has())
    return {};
  return PlatformSpecificHandleTraits::close(release());
}

void Handle::reset(Raw NewValue) noexcept
{
  if (has())
  {
    std::string Name = to_string();
    std::error_code EC = close();
    if (EC)
      LOG(warn) << "Closing handle #" << Name << " failed: " << EC.message();
  }
  Value = NewValue;
}

} // namespace ptyspawn::system

#undef LOG
