/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <utility>

#include <fcntl.h>

#include "ptyspawn/system/Handle.hpp"

namespace ptyspawn::system::unix
{

/// This is a smart file descriptor wrapper which will call \p close() on the
/// underlying resource at the end of its life.
///
/// \note \p fd is not a polymorphic class. Due to using the \p HandleTraits
/// detail implementation, it is always safe to assign an \p fd instance to a
/// \p Handle instance.
class fd : public Handle // NOLINT(readability-identifier-naming)
{
public:
  using Traits = HandleTraits<PlatformTag::Unix>;

  /// The file descriptor type on a POSIX system.
  using raw_fd = Traits::raw_fd;

  /// The type used by system calls dealing with flags.
  using flag_t = decltype(O_RDONLY);

  /// Creates an empty file descriptor that does not wrap anything.
  fd() noexcept = default;

  /// Wrap the raw platform resource handle into the RAII object.
  fd(raw_fd Value) noexcept;

  /// Creates an anonymous pipe. Both ends are marked close-on-exec.
  ///
  /// \returns the read and the write end, in this order.
  ///
  /// \see pipe2(2)
  [[nodiscard]] static std::pair<fd, fd> pipe();

  /// Duplicates \p FD to the lowest free descriptor above \p Floor. The copy
  /// is marked close-on-exec.
  ///
  /// \see F_DUPFD_CLOEXEC
  [[nodiscard]] static fd duplicateAbove(raw_fd FD, raw_fd Floor);

  /// Adds the given \p Flag, from \p fcntl() flags, to the flags of the given
  /// file descriptor \p FD.
  static void addDescriptorFlag(raw_fd FD, flag_t Flag);

  /// Shortcut function that sets \p FD_CLOEXEC on a file, so it is not
  /// inherited by child processes in a \p fork() - \p exec() situation.
  static void setCloseOnExec(raw_fd FD) { addDescriptorFlag(FD, FD_CLOEXEC); }
};

static_assert(sizeof(Handle) == sizeof(fd),
              "Handle implementation MUST be non-polymorphic!");

} // namespace ptyspawn::system::unix
