/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cerrno>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace ptyspawn
{

// Hardcode this, because decltype(errno) would not be portable.
// errno might be defined only as a macro!
using errno_t = int;

namespace detail
{

template <typename R> struct Result
{
private:
  R Value;
  bool Errored;
  std::error_code ErrorCode;

public:
  Result(R&& Value, bool Errored, std::error_code Error)
    : Value(std::move(Value)), Errored(Errored), ErrorCode(Error)
  {}

  explicit operator bool() const noexcept { return !Errored; }
  [[nodiscard]] std::error_code getError() const noexcept { return ErrorCode; }
  R& get() noexcept { return Value; }
  const R& get() const noexcept { return Value; }
};

/// \returns the \p errno value of the last failing call as an error code.
inline std::error_code lastErrno() noexcept
{
  return std::make_error_code(static_cast<std::errc>(errno));
}

} // namespace detail

/// Allows executing a system call with automatically handled \p errno checking.
///
/// Clients MUST pass a lambda that returns the value of the system call, and
/// list ALL the values which might indicate a FAILED system call.
///
/// Example:
///
///   \code{.cpp}
///   auto Open = CheckedErrno([]() {
///     return ::open("foo", O_RDONLY);
///   }, /* ErrorIndicatingReturnValue =*/-1);
///
///   if (!Open) {
///     // Do something as the call failed.
///   }
///   Open.get(); // Obtain the return value from the lambda.
///   \endcode
template <typename Fn, typename... ErrTys>
decltype(auto)
// NOLINTNEXTLINE(readability-identifier-naming)
CheckedErrno(Fn&& F, ErrTys&&... ErrorValues) noexcept
{
  using namespace ptyspawn::detail;
  static_assert(!std::is_same_v<decltype(F()), void>,
                "Lambda must return something!");

  errno = 0;
  auto ReturnValue = F();
  bool Errored = (false || ... || (ReturnValue == ErrorValues));
  return Result<decltype(ReturnValue)>{
    std::move(ReturnValue), Errored, Errored ? lastErrno() : std::error_code{}};
}

/// Same as \p CheckedErrno, but transparently restarts the call as long as it
/// fails with \p EINTR. Meant for the blocking calls (\p read(), \p write(),
/// \p waitid()) that a signal delivered to the process may interrupt.
template <typename Fn, typename... ErrTys>
decltype(auto)
// NOLINTNEXTLINE(readability-identifier-naming)
CheckedErrnoRetry(Fn&& F, ErrTys&&... ErrorValues) noexcept
{
  while (true)
  {
    auto R = CheckedErrno(F, ErrorValues...);
    if (!R && R.getError() == std::errc::interrupted)
      continue;
    return R;
  }
}

/// Allows executing a system call with translating an error to an exception.
///
/// Clients MUST pass a lambda that returns the value of the system call, and
/// list ALL the values which might indicate a FAILED system call.
///
/// If the call fails, this function throws an exception of type \p ExTy, which
/// must be constructible from an \p std::error_code and a message.
template <typename ExTy = std::system_error, typename Fn, typename... ErrTys>
decltype(auto)
// NOLINTNEXTLINE(readability-identifier-naming)
CheckedErrnoThrow(Fn&& F, const std::string& ErrMsg, ErrTys&&... ErrorValues)
{
  auto Result =
    CheckedErrno(std::forward<Fn>(F), std::forward<ErrTys>(ErrorValues)...);
  if (!Result)
    throw ExTy{Result.getError(), ErrMsg};

  // Make sure to not return an `int &` or something similar dangling!
  std::remove_reference_t<decltype(Result.get())> Copy = Result.get();
  return Copy;
}

} // namespace ptyspawn
