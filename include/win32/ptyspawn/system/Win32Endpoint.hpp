/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <string>

#include "ptyspawn/system/Endpoint.hpp"

namespace ptyspawn::system::win32
{

/// An endpoint made of the ends of two anonymous pipes, one for each
/// direction.
class Endpoint : public system::Endpoint
{
public:
  /// Takes ownership of \p Read and \p Write.
  Endpoint(Handle Read, Handle Write, std::string Name);
  ~Endpoint() noexcept override = default;

  /// \returns the pseudo console session the pipes are joined to, or
  /// \p nullptr if the session had been closed.
  [[nodiscard]] Handle::Raw raw() const noexcept override;

  /// \returns the reading pipe end.
  [[nodiscard]] Handle::Raw reader() const noexcept { return Read.get(); }

  /// Closes the writing pipe end alone, signalling the end of input to the
  /// other side.
  std::error_code closeWrite() noexcept { return Write.close(); }

protected:
  std::size_t readImpl(char* Buffer, std::size_t Size) override;
  std::size_t writeImpl(const char* Buffer, std::size_t Size) override;
  std::error_code closeImpl() noexcept override;

private:
  Handle Read;
  Handle Write;
};

} // namespace ptyspawn::system::win32
