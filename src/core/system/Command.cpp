/* SPDX-License-Identifier: LGPL-3.0-only */
#include <utility>

#include "ptyspawn/Error.hpp"

#include "ptyspawn/system/Command.hpp"

namespace ptyspawn::system
{

Command Command::create(std::string Program, std::vector<std::string> Args)
{
  Command C;
  C.Arguments.reserve(Args.size() + 1);
  C.Arguments.push_back(Program);
  for (std::string& Arg : Args)
    C.Arguments.push_back(std::move(Arg));
  C.Program = std::move(Program);
  return C;
}

void Command::validate() const
{
  if (Program.empty())
    throw LaunchError{std::make_error_code(std::errc::invalid_argument),
                      "exec: no command"};
  if (Arguments.empty())
    throw LaunchError{std::make_error_code(std::errc::invalid_argument),
                      "exec: " + Program + ": empty argument vector"};
}

} // namespace ptyspawn::system
