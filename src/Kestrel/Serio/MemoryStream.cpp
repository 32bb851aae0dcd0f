//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Kestrel/Serio/MemoryStream.h>

#include <algorithm>
#include <cstring>
#include <limits>
#include <new>

using kestrel::Result;
using kestrel::serio::MemoryStream;

MemoryStream::MemoryStream(const std::span<std::byte> buffer) noexcept
  : external_buffer_(buffer)
{
}

auto MemoryStream::GetBuffer() noexcept -> std::span<std::byte>
{
  return external_buffer_.empty() ? std::span(internal_buffer_)
                                  : external_buffer_;
}

auto MemoryStream::GetBuffer() const noexcept -> std::span<const std::byte>
{
  return external_buffer_.empty() ? std::span(internal_buffer_)
                                  : external_buffer_;
}

auto MemoryStream::Write(const std::byte* data, const std::size_t size) noexcept
  -> Result<void>
{
  if (data == nullptr && size > 0) {
    return std::errc::invalid_argument;
  }
  if (size > (std::numeric_limits<std::size_t>::max)() - pos_) {
    return std::errc::value_too_large;
  }

  auto buffer = GetBuffer();
  if (pos_ + size > buffer.size()) {
    if (!external_buffer_.empty()) {
      return std::errc::no_buffer_space;
    }
    try {
      internal_buffer_.resize(pos_ + size);
    } catch (const std::bad_alloc&) {
      return std::errc::not_enough_memory;
    }
    buffer = std::span(internal_buffer_);
  }

  if (size > 0) {
    std::memcpy(buffer.data() + pos_, data, size);
  }
  pos_ += size;
  return {};
}

auto MemoryStream::Read(std::byte* data, const std::size_t size) noexcept
  -> Result<void>
{
  if (data == nullptr && size > 0) {
    return std::errc::invalid_argument;
  }

  const auto buffer = GetBuffer();
  if (pos_ > buffer.size() || buffer.size() - pos_ < size) {
    return std::errc::io_error;
  }

  if (size > 0) {
    std::memcpy(data, buffer.data() + pos_, size);
  }
  pos_ += size;
  return {};
}

// NOLINTNEXTLINE(readability-convert-member-functions-to-static)
auto MemoryStream::Flush() noexcept -> Result<void> { return {}; }

auto MemoryStream::Size() const noexcept -> Result<std::size_t>
{
  return GetBuffer().size();
}

auto MemoryStream::Position() const noexcept -> Result<std::size_t>
{
  return pos_;
}

auto MemoryStream::Seek(const std::size_t pos) noexcept -> Result<void>
{
  if (pos > GetBuffer().size()) {
    return std::errc::invalid_seek;
  }
  pos_ = pos;
  return {};
}

auto MemoryStream::Reset() noexcept -> void { pos_ = 0; }

auto MemoryStream::Data() const noexcept -> std::span<const std::byte>
{
  return GetBuffer();
}

auto MemoryStream::Clear() -> void
{
  if (external_buffer_.empty()) {
    internal_buffer_.clear();
  } else {
    std::ranges::fill(external_buffer_, std::byte { 0x00 });
  }
  Reset();
}
