/* SPDX-License-Identifier: LGPL-3.0-only */
#include "ptyspawn/Error.hpp"

namespace ptyspawn
{

namespace
{

class ErrorCategory : public std::error_category
{
public:
  [[nodiscard]] const char* name() const noexcept override
  {
    return "ptyspawn";
  }

  [[nodiscard]] std::string message(int Value) const override
  {
    switch (static_cast<errc>(Value))
    {
      case errc::unsupported:
        return "unsupported";
      case errc::not_a_pty:
        return "not a pty";
      case errc::closed:
        return "file already closed";
      case errc::process_failed:
        return "process exited abnormally";
    }
    return "unknown ptyspawn error";
  }
};

} // namespace

const std::error_category& error_category() noexcept
{
  static const ErrorCategory Category;
  return Category;
}

} // namespace ptyspawn
