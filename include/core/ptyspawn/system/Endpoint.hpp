/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <atomic>
#include <string>
#include <string_view>
#include <system_error>

#include "ptyspawn/system/Handle.hpp"

namespace ptyspawn::system
{

class Pty;

/// One side of a terminal pair: a readable and writable byte stream.
///
/// The \e master endpoint is held by the program that launched the child, and
/// the \e slave endpoint is the side that the child is attached to.
class Endpoint
{
public:
  Endpoint(const Endpoint&) = delete;
  Endpoint& operator=(const Endpoint&) = delete;
  virtual ~Endpoint() noexcept = default;

  /// \returns the platform-assigned identifier of the endpoint, such as the
  /// path of a device, or a fixed label.
  [[nodiscard]] const std::string& name() const noexcept { return Name; }

  /// \returns the numeric descriptor or handle of the endpoint.
  [[nodiscard]] virtual Handle::Raw raw() const noexcept = 0;

  /// \returns the terminal pair this endpoint belongs to, or \p nullptr.
  [[nodiscard]] Pty* owner() const noexcept { return Owner; }

  /// \returns whether the endpoint had not been closed yet.
  [[nodiscard]] bool isOpen() const noexcept { return Open.load(); }

  /// Reads at most \p Size bytes into \p Buffer. Blocks until at least one
  /// byte is available.
  ///
  /// \returns the number of bytes read, which is \p 0 only if the stream
  /// ended (the other side was closed for good).
  ///
  /// \throws ClosedError if the endpoint had been closed.
  /// \throws RuntimeIOError if the operating system reported an error.
  std::size_t read(char* Buffer, std::size_t Size);

  /// Read at maximum \p Bytes bytes of data. An empty result indicates the end
  /// of the stream.
  [[nodiscard]] std::string read(std::size_t Bytes);

  /// Write the contents of \p Buffer, potentially only partially.
  ///
  /// \returns the number of bytes written, as reported by the operating system.
  std::size_t write(std::string_view Buffer);

  /// Write the entire contents of \p Buffer, retrying partial writes.
  void writeAll(std::string_view Buffer);

  /// Closes the endpoint. Closing an already closed endpoint succeeds without
  /// side effects.
  ///
  /// \note Closing the master endpoint of a terminal pair tears down the whole
  /// pair, see \p Pty::close().
  std::error_code close();

protected:
  explicit Endpoint(std::string Name);

  /// Implemented by subclasses to actually perform reading from the system.
  virtual std::size_t readImpl(char* Buffer, std::size_t Size) = 0;
  /// Implemented by subclasses to actually perform writing to the system.
  virtual std::size_t writeImpl(const char* Buffer, std::size_t Size) = 0;
  /// Implemented by subclasses to release the system resources.
  virtual std::error_code closeImpl() noexcept = 0;

private:
  friend class Pty;

  /// Releases the resources of this endpoint alone, exactly once.
  std::error_code closeHandles() noexcept;

  std::string Name;
  std::atomic<bool> Open{true};
  Pty* Owner = nullptr;
  bool ClosesOwner = false;
};

} // namespace ptyspawn::system
