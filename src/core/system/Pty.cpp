/* SPDX-License-Identifier: LGPL-3.0-only */
#include <utility>

#include "ptyspawn/system/Pty.hpp"

#include "ptyspawn/Log.hpp"
#define LOG(SEVERITY) ptyspawn::log::SEVERITY("system/Pty")
#define LOG_WITH_IDENTIFIER(SEVERITY) LOG(SEVERITY) << Slave->name() << ": "

namespace ptyspawn::system
{

void Pty::adopt(std::unique_ptr<Endpoint> Master,
                std::unique_ptr<Endpoint> Slave)
{
  this->Master = std::move(Master);
  this->Slave = std::move(Slave);

  this->Master->Owner = this;
  this->Master->ClosesOwner = true;
  this->Slave->Owner = this;
}

void Pty::setSize(Size S)
{
  PTYSPAWN_TRACE_LOG(LOG_WITH_IDENTIFIER(data) << "setSize(Rows=" << S.Rows
                                               << ", Columns=" << S.Columns
                                               << ')');
  Guard.withOpen([this, S] { setSizeImpl(S); }, "setsize");
}

Pty::Size Pty::getSize()
{
  return Guard.withOpen([this] { return getSizeImpl(); }, "getsize");
}

std::error_code Pty::close()
{
  return Guard.close([this] {
    LOG_WITH_IDENTIFIER(debug) << "Tearing down...";
    return destroy();
  });
}

std::error_code Pty::releaseSlave() noexcept
{
  PTYSPAWN_TRACE_LOG(LOG_WITH_IDENTIFIER(trace) << "Releasing slave side...");
  return closeEndpoint(*Slave);
}

void Pty::closeOnDestruction() noexcept
{
  try
  {
    std::error_code EC = close();
    if (EC)
      LOG_WITH_IDENTIFIER(error) << "Teardown failed: " << EC.message();
  }
  catch (const std::exception& Ex)
  {
    LOG(error) << "Teardown failed on destruction: " << Ex.what();
  }
}

} // namespace ptyspawn::system

#undef LOG_WITH_IDENTIFIER
#undef LOG
