/* SPDX-License-Identifier: LGPL-3.0-only */
#include <utility>

#include <unistd.h>

#include "ptyspawn/CheckedErrno.hpp"
#include "ptyspawn/Error.hpp"

#include "ptyspawn/system/UnixEndpoint.hpp"

#include "ptyspawn/Log.hpp"
#define LOG(SEVERITY) ptyspawn::log::SEVERITY("system/UnixEndpoint")
#define LOG_WITH_IDENTIFIER(SEVERITY) LOG(SEVERITY) << name() << ": "

namespace ptyspawn::system::unix
{

Endpoint::Endpoint(fd FD, std::string Name, bool EndOfStreamOnIOError)
  : system::Endpoint(std::move(Name)), FD(std::move(FD)),
    EndOfStreamOnIOError(EndOfStreamOnIOError)
{}

std::size_t Endpoint::readImpl(char* Buffer, std::size_t Size)
{
  auto ReadBytes = CheckedErrnoRetry(
    [RawFD = FD.get(), Buffer, Size] { return ::read(RawFD, Buffer, Size); },
    -1);
  if (!ReadBytes)
  {
    std::error_code EC = ReadBytes.getError();
    if (EndOfStreamOnIOError && EC == std::errc::io_error /* EIO */)
    {
      PTYSPAWN_TRACE_LOG(LOG_WITH_IDENTIFIER(trace)
                         << "Other side hung up, end of stream.");
      return 0;
    }

    LOG_WITH_IDENTIFIER(error) << "Read error: " << EC.message();
    throw RuntimeIOError{EC, "read " + name()};
  }
  return static_cast<std::size_t>(ReadBytes.get());
}

std::size_t Endpoint::writeImpl(const char* Buffer, std::size_t Size)
{
  auto WrittenBytes = CheckedErrnoRetry(
    [RawFD = FD.get(), Buffer, Size] { return ::write(RawFD, Buffer, Size); },
    -1);
  if (!WrittenBytes)
  {
    std::error_code EC = WrittenBytes.getError();
    LOG_WITH_IDENTIFIER(error) << "Write error: " << EC.message();
    throw RuntimeIOError{EC, "write " + name()};
  }
  return static_cast<std::size_t>(WrittenBytes.get());
}

std::error_code Endpoint::closeImpl() noexcept { return FD.close(); }

} // namespace ptyspawn::system::unix

#undef LOG_WITH_IDENTIFIER
#undef LOG
