/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <string>
#include <system_error>

#include "ptyspawn/system/PlatformTraits.hpp"

namespace ptyspawn::system
{

/// Exclusive owner of a single OS-level resource (a file descriptor, or a
/// kernel object handle). The resource is closed when the owner dies, and the
/// failure of that implicit close is logged, not thrown.
class Handle
{
public:
  using Raw = PlatformSpecificHandleTraits::RawTy;

  Handle() noexcept = default;
  ~Handle() noexcept;

  /// Takes ownership of \p Value.
  [[nodiscard]] static Handle wrap(Raw Value) noexcept;

  Handle(Handle&& RHS) noexcept : Value(RHS.release()) {}
  Handle& operator=(Handle&& RHS) noexcept
  {
    if (this != &RHS)
      reset(RHS.release());
    return *this;
  }
  Handle(const Handle&) = delete;
  Handle& operator=(const Handle&) = delete;

  [[nodiscard]] bool has() const noexcept
  {
    return Value != PlatformSpecificHandleTraits::Invalid;
  }
  [[nodiscard]] Raw get() const noexcept { return Value; }
  operator Raw() const noexcept { return Value; }

  /// Gives up the ownership of the resource without closing it.
  [[nodiscard]] Raw release() noexcept
  {
    Raw Released = Value;
    Value = PlatformSpecificHandleTraits::Invalid;
    return Released;
  }

  /// Closes the resource now. Does nothing if there is no resource.
  ///
  /// \returns the error of the close call.
  std::error_code close() noexcept;

  /// Closes the current resource (logging the failure, if any), and starts
  /// owning \p NewValue.
  void reset(Raw NewValue = PlatformSpecificHandleTraits::Invalid) noexcept;

  [[nodiscard]] std::string
  to_string() const // NOLINT(readability-identifier-naming)
  {
    return PlatformSpecificHandleTraits::to_string(Value);
  }

protected:
  explicit Handle(Raw Value) noexcept;

private:
  Raw Value = PlatformSpecificHandleTraits::Invalid;
};

} // namespace ptyspawn::system
