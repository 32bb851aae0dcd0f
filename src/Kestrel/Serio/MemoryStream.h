//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include <Kestrel/Base/Macros.h>
#include <Kestrel/Base/Result.h>
#include <Kestrel/Serio/Stream.h>
#include <Kestrel/Serio/api_export.h>

namespace kestrel::serio {

//! In-memory, seekable byte stream.
/*!
 Backed either by an internal buffer that grows on write, or by an external
 fixed-size buffer that it does not own (writes past its end fail with
 `std::errc::no_buffer_space`). Reads past the end fail with
 `std::errc::io_error` and do not move the position.

 Used with `Writer` / `Reader` through the `Stream` concept, without virtual
 dispatch.
*/
class MemoryStream {
public:
  KSTL_SERIO_API explicit MemoryStream(
    std::span<std::byte> buffer = {}) noexcept;

  ~MemoryStream() = default;

  KESTREL_MAKE_NON_COPYABLE(MemoryStream)
  KESTREL_DEFAULT_MOVABLE(MemoryStream)

  KSTL_SERIO_NDAPI auto Read(std::byte* data, std::size_t size) noexcept
    -> Result<void>;

  [[nodiscard]] auto Write(const std::span<const std::byte> data) noexcept
    -> Result<void>
  {
    return Write(data.data(), data.size());
  }

  KSTL_SERIO_NDAPI auto Write(const std::byte* data, std::size_t size) noexcept
    -> Result<void>;

  KSTL_SERIO_NDAPI auto Flush() noexcept -> Result<void>;

  KSTL_SERIO_NDAPI auto Size() const noexcept -> Result<std::size_t>;

  KSTL_SERIO_NDAPI auto Position() const noexcept -> Result<std::size_t>;

  KSTL_SERIO_NDAPI auto Seek(std::size_t pos) noexcept -> Result<void>;

  //! Rewind to the beginning; the content is kept.
  KSTL_SERIO_API auto Reset() noexcept -> void;

  KSTL_SERIO_NDAPI auto Data() const noexcept -> std::span<const std::byte>;

  //! Drop the internal buffer content, or zero the external buffer, and
  //! rewind.
  KSTL_SERIO_API auto Clear() -> void;

private:
  [[nodiscard]] auto GetBuffer() noexcept -> std::span<std::byte>;
  [[nodiscard]] auto GetBuffer() const noexcept -> std::span<const std::byte>;

  std::vector<std::byte> internal_buffer_;
  std::span<std::byte> external_buffer_;
  std::size_t pos_ = 0;
};

static_assert(Stream<MemoryStream>);

} // namespace kestrel::serio
