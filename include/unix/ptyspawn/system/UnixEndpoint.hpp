/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <string>

#include "ptyspawn/system/Endpoint.hpp"
#include "ptyspawn/system/fd.hpp"

namespace ptyspawn::system::unix
{

/// An endpoint backed by a single file descriptor that is both readable and
/// writable.
class Endpoint : public system::Endpoint
{
public:
  /// Takes ownership of \p FD.
  ///
  /// \param EndOfStreamOnIOError If set, an \p EIO from \p read() is reported
  /// as the end of the stream. The master side of a terminal-pair device
  /// returns \p EIO once every slave descriptor had been closed.
  Endpoint(fd FD, std::string Name, bool EndOfStreamOnIOError = false);
  ~Endpoint() noexcept override = default;

  [[nodiscard]] Handle::Raw raw() const noexcept override { return FD.get(); }

protected:
  std::size_t readImpl(char* Buffer, std::size_t Size) override;
  std::size_t writeImpl(const char* Buffer, std::size_t Size) override;
  std::error_code closeImpl() noexcept override;

private:
  fd FD;
  bool EndOfStreamOnIOError;
};

} // namespace ptyspawn::system::unix
