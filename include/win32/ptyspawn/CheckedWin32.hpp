/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

#include <windows.h>

#include "ptyspawn/CheckedErrno.hpp"

namespace ptyspawn
{

namespace detail
{

/// \returns the \p GetLastError() value of the last failing call as an error
/// code.
inline std::error_code lastWin32Error() noexcept
{
  return {static_cast<int>(::GetLastError()), std::system_category()};
}

} // namespace detail

/// Allows executing a Win32 API call with automatically handled
/// \p GetLastError() checking.
///
/// Clients MUST pass a lambda that returns the value of the API call, and list
/// ALL the values which might indicate a FAILED call. (This is usually
/// \p FALSE for the \p BOOL functions.)
///
/// \see CheckedErrno
template <typename Fn, typename... ErrTys>
decltype(auto)
// NOLINTNEXTLINE(readability-identifier-naming)
CheckedWin32(Fn&& F, ErrTys&&... ErrorValues) noexcept
{
  using namespace ptyspawn::detail;
  static_assert(!std::is_same_v<decltype(F()), void>,
                "Lambda must return something!");

  ::SetLastError(ERROR_SUCCESS);
  auto ReturnValue = F();
  bool Errored = (false || ... || (ReturnValue == ErrorValues));
  return Result<decltype(ReturnValue)>{std::move(ReturnValue),
                                       Errored,
                                       Errored ? lastWin32Error()
                                               : std::error_code{}};
}

/// Allows executing a Win32 API call with translating an error to an
/// exception of type \p ExTy.
///
/// \see CheckedErrnoThrow
template <typename ExTy = std::system_error, typename Fn, typename... ErrTys>
decltype(auto)
// NOLINTNEXTLINE(readability-identifier-naming)
CheckedWin32Throw(Fn&& F, const std::string& ErrMsg, ErrTys&&... ErrorValues)
{
  auto Result =
    CheckedWin32(std::forward<Fn>(F), std::forward<ErrTys>(ErrorValues)...);
  if (!Result)
    throw ExTy{Result.getError(), ErrMsg};

  std::remove_reference_t<decltype(Result.get())> Copy = Result.get();
  return Copy;
}

/// Converts the failing \p HRESULT \p HR into an error code. Results wrapping
/// a Win32 error code (\p FACILITY_WIN32) are unwrapped to the original code,
/// so they compare equal to the \p GetLastError() value.
inline std::error_code hresultError(HRESULT HR) noexcept
{
  auto Code = static_cast<std::uint32_t>(HR);
  if ((Code & 0x1FFF0000U) == 0x00070000U)
    Code &= 0xFFFFU;
  return {static_cast<int>(Code), std::system_category()};
}

} // namespace ptyspawn
