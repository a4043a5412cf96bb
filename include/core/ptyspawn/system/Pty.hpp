/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <memory>
#include <system_error>

#include "ptyspawn/system/Endpoint.hpp"
#include "ptyspawn/system/LifecycleGuard.hpp"

namespace ptyspawn::system
{

/// Responsible for wrapping a low-level pseudo terminal teletypewriter (PTTY)
/// interface. A pseudoterminal is an emulation of the ancient technology where
/// physical typewriter and printer machines were connected to computers.
///
/// A \p Pty owns the platform resource of the pair exclusively, and is shared
/// between the client and the monitor of the process started on it.
class Pty : public std::enable_shared_from_this<Pty>
{
public:
  /// The dimensions of the terminal, in character cells.
  struct Size
  {
    unsigned short Rows = 0;
    unsigned short Columns = 0;
  };

  /// Allocates a new terminal pair with the facility of the current platform.
  ///
  /// \throws AllocationError if the platform failed to create the pair.
  /// \throws UnsupportedError if the platform lacks the facility.
  [[nodiscard]] static std::shared_ptr<Pty> create();

  Pty(const Pty&) = delete;
  Pty& operator=(const Pty&) = delete;
  virtual ~Pty() noexcept = default;

  /// \returns the controlling side of the pair, held by the launching program.
  [[nodiscard]] Endpoint& master() noexcept { return *Master; }
  /// \returns the side of the pair that a child process is attached to.
  [[nodiscard]] Endpoint& slave() noexcept { return *Slave; }

  [[nodiscard]] LifecycleGuard::State state() const { return Guard.state(); }
  [[nodiscard]] bool isOpen() const
  {
    return state() == LifecycleGuard::State::Open;
  }

  /// Sets the size of the pseudoterminal device to have the given dimensions.
  ///
  /// \throws ClosedError if the pair had been torn down.
  void setSize(Size S);
  void setSize(unsigned short Rows, unsigned short Columns)
  {
    setSize(Size{Rows, Columns});
  }

  /// \returns the current size of the pseudoterminal device.
  ///
  /// \throws ClosedError if the pair had been torn down.
  [[nodiscard]] Size getSize();

  /// Tears down the pair and releases the platform resource. Exactly one
  /// teardown ever happens. Calling \p close() on a closed pair succeeds
  /// without side effects, and calling it while another thread tears the pair
  /// down waits for and returns the result of that teardown.
  std::error_code close();

  /// Closes the slave side handles held by the current process. Called once a
  /// child had been attached to the slave, so the child holds the only
  /// reference to it.
  std::error_code releaseSlave() noexcept;

  /// Notifies the pair that the process attached to it had exited.
  ///
  /// \returns the error of the teardown this triggers, if any.
  virtual std::error_code childExited() { return {}; }

protected:
  Pty() = default;

  /// Takes ownership of the endpoints of the pair. The \p Master endpoint
  /// becomes the handle through which the whole pair is closed.
  void adopt(std::unique_ptr<Endpoint> Master, std::unique_ptr<Endpoint> Slave);

  /// Releases the resources of \p E alone.
  static std::error_code closeEndpoint(Endpoint& E) noexcept
  {
    return E.closeHandles();
  }

  /// Executes the teardown, if it was not done yet. Meant to be called from
  /// the destructor of the implementations, as \p destroy() is not available
  /// anymore in the base class's destructor.
  void closeOnDestruction() noexcept;

  /// Implemented by subclasses to release the platform resources of the pair.
  /// Called exactly once.
  virtual std::error_code destroy() = 0;
  /// Implemented by subclasses to execute the resize on the platform.
  virtual void setSizeImpl(Size S) = 0;
  /// Implemented by subclasses to execute the size query on the platform.
  [[nodiscard]] virtual Size getSizeImpl() = 0;

private:
  LifecycleGuard Guard;
  std::unique_ptr<Endpoint> Master;
  std::unique_ptr<Endpoint> Slave;
};

} // namespace ptyspawn::system
