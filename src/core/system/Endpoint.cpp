/* SPDX-License-Identifier: LGPL-3.0-only */
#include <utility>
#include <vector>

#include "ptyspawn/Error.hpp"
#include "ptyspawn/system/Pty.hpp"

#include "ptyspawn/system/Endpoint.hpp"

#include "ptyspawn/Log.hpp"
#define LOG(SEVERITY) ptyspawn::log::SEVERITY("system/Endpoint")
#define LOG_WITH_IDENTIFIER(SEVERITY) LOG(SEVERITY) << name() << ": "

namespace ptyspawn::system
{

Endpoint::Endpoint(std::string Name) : Name(std::move(Name)) {}

std::size_t Endpoint::read(char* Buffer, std::size_t Size)
{
  if (!isOpen())
    throw ClosedError{"read " + name()};

  PTYSPAWN_TRACE_LOG(LOG_WITH_IDENTIFIER(data)
                     << "Reading " << Size << " bytes...");
  return readImpl(Buffer, Size);
}

std::string Endpoint::read(std::size_t Bytes)
{
  std::vector<char> Buffer(Bytes);
  std::size_t Count = read(Buffer.data(), Buffer.size());
  return {Buffer.data(), Count};
}

std::size_t Endpoint::write(std::string_view Buffer)
{
  if (!isOpen())
    throw ClosedError{"write " + name()};

  PTYSPAWN_TRACE_LOG(LOG_WITH_IDENTIFIER(data)
                     << "Writing " << Buffer.size() << " bytes...");
  return writeImpl(Buffer.data(), Buffer.size());
}

void Endpoint::writeAll(std::string_view Buffer)
{
  while (!Buffer.empty())
  {
    std::size_t Written = write(Buffer);
    if (Written == 0)
      throw RuntimeIOError{std::make_error_code(std::errc::broken_pipe),
                           "write " + name()};
    Buffer.remove_prefix(Written);
  }
}

std::error_code Endpoint::close()
{
  if (ClosesOwner && Owner)
    return Owner->close();
  return closeHandles();
}

std::error_code Endpoint::closeHandles() noexcept
{
  if (!Open.exchange(false))
    return {};

  PTYSPAWN_TRACE_LOG(LOG_WITH_IDENTIFIER(trace) << "Closing...");
  std::error_code EC = closeImpl();
  if (EC)
    LOG_WITH_IDENTIFIER(warn) << "Failed to close: " << EC.message();
  return EC;
}

} // namespace ptyspawn::system

#undef LOG_WITH_IDENTIFIER
#undef LOG
