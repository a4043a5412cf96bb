/* SPDX-License-Identifier: LGPL-3.0-only */
#include "ptyspawn/system/Platform.hpp"

namespace ptyspawn::system
{

const std::vector<std::string>& Platform::mandatoryEnvironment()
{
  static const std::vector<std::string> Keys;
  return Keys;
}

} // namespace ptyspawn::system
