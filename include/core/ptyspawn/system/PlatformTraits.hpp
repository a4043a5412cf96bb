/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include "ptyspawn/Config.h"
#include "ptyspawn/system/Platform.hpp"

#ifdef PTYSPAWN_PLATFORM_UNIX
#include "ptyspawn/system/UnixHandleTraits.hpp"
#include "ptyspawn/system/UnixProcessTraits.hpp"
#endif /* PTYSPAWN_PLATFORM_UNIX */

#ifdef PTYSPAWN_PLATFORM_WIN32
#include "ptyspawn/system/Win32HandleTraits.hpp"
#include "ptyspawn/system/Win32ProcessTraits.hpp"
#endif /* PTYSPAWN_PLATFORM_WIN32 */

namespace ptyspawn::system
{

/// The platform the library was configured for.
constexpr PlatformTag CurrentPlatform =
  static_cast<PlatformTag>(PTYSPAWN_PLATFORM_ID);

static_assert(CurrentPlatform != PlatformTag::Unsupported,
              "No terminal implementation for the configured platform!");

using PlatformSpecificHandleTraits = HandleTraits<CurrentPlatform>;
using PlatformSpecificProcessTraits = ProcessTraits<CurrentPlatform>;

} // namespace ptyspawn::system
