/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <string>
#include <system_error>

#include "ptyspawn/system/Platform.hpp"

namespace ptyspawn::system
{

/// Resources on POSIX are plain file descriptors: the two sides of a terminal
/// pair, and the pipes used during the launch of a child.
template <> struct HandleTraits<PlatformTag::Unix>
{
  using raw_fd = int;
  using RawTy = raw_fd;

  static constexpr RawTy Invalid = -1;

  /// \returns the error reported by \p close(2). An interrupted \p close() is
  /// not retried, as the descriptor is already released by then.
  static std::error_code close(RawTy FD) noexcept;

  // NOLINTNEXTLINE(readability-identifier-naming)
  [[nodiscard]] static std::string to_string(RawTy FD);
};

} // namespace ptyspawn::system
