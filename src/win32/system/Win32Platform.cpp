/* SPDX-License-Identifier: LGPL-3.0-only */
#include "ptyspawn/system/Platform.hpp"

namespace ptyspawn::system
{

const std::vector<std::string>& Platform::mandatoryEnvironment()
{
  // Without it, a lot of the system libraries fail to load in the child.
  static const std::vector<std::string> Keys{"SYSTEMROOT"};
  return Keys;
}

} // namespace ptyspawn::system
