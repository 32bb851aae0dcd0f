//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

#include <Kestrel/Base/Logging.h>
#include <Kestrel/Base/Macros.h>
#include <Kestrel/Base/Result.h>
#include <Kestrel/Serio/Stream.h>

namespace kestrel::serio {

//! Abstract interface for binary data writers supporting type-erased access.
/*!
 Provides a non-template interface for writing binary data to a stream, so that
 `Store` overloads can be written once for any concrete `Writer`.

 Values are written packed, with no alignment padding, in little-endian byte
 order regardless of the host.
*/
class AnyWriter {
public:
  AnyWriter() = default;
  virtual ~AnyWriter() = default;

  KESTREL_DEFAULT_COPYABLE(AnyWriter)
  KESTREL_DEFAULT_MOVABLE(AnyWriter)

  [[nodiscard]] virtual auto WriteBlob(std::span<const std::byte> blob) noexcept
    -> Result<void>
    = 0;

  [[nodiscard]] auto WriteSequenceSize(const limits::SequenceSizeType size,
    const limits::SequenceSizeType max) noexcept -> Result<void>
  {
    if (size > max) {
      return std::errc::value_too_large;
    }
    return Write(size);
  }

  [[nodiscard]] virtual auto Position() const noexcept -> Result<size_t> = 0;

  [[nodiscard]] virtual auto Flush() noexcept -> Result<void> = 0;

  //! Serialize `value` with the `Store` overload found for `T`.
  template <typename T>
  [[nodiscard]] auto Write(const T& value) noexcept -> Result<void>
  {
    try {
      return Store(*this, value);
    } catch (const std::exception& ex) {
      LOG_F(ERROR, "ADL specialization of Store failed: {}", ex.what());
      return std::errc::io_error;
    }
  }
};

//! Concrete binary writer for a specific stream type.
/*!
 ```cpp
 MemoryStream stream;
 Writer<MemoryStream> writer(stream);
 CHECK_RESULT(writer.Write(value));
 ```

 @tparam S Stream type implementing the Stream concept.
 @see AnyWriter, Store, MemoryStream
*/
template <Stream S> class Writer : public AnyWriter {
public:
  explicit Writer(S& stream) noexcept
    : stream_(stream)
  {
  }

  ~Writer() override = default;

  KESTREL_MAKE_NON_COPYABLE(Writer)
  KESTREL_MAKE_NON_MOVABLE(Writer)

  [[nodiscard]] auto WriteBlob(std::span<const std::byte> blob) noexcept
    -> Result<void> override
  {
    return stream_.get().Write(blob.data(), blob.size());
  }

  [[nodiscard]] auto Position() const noexcept -> Result<size_t> override
  {
    return stream_.get().Position();
  }

  [[nodiscard]] auto Flush() noexcept -> Result<void> override
  {
    return stream_.get().Flush();
  }

private:
  std::reference_wrapper<S> stream_;
};

//=== Store specializations ===-----------------------------------------------//

//! Serializes an integral value (except bool) in little-endian byte order.
template <typename T>
auto Store(AnyWriter& writer, T value) -> Result<void>
  requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
{
  static_assert(std::has_unique_object_representations_v<T>,
    "Type may have platform-dependent representation");
  if constexpr (std::endian::native == std::endian::big && sizeof(T) > 1) {
    value = std::byteswap(value);
  }
  return writer.WriteBlob(
    // NOLINTNEXTLINE(*-reinterpret-cast)
    std::span(reinterpret_cast<const std::byte*>(&value), sizeof(T)));
}

//! Serializes a bool as a single byte, 0 or 1.
inline auto Store(AnyWriter& writer, const bool value) -> Result<void>
{
  return Store(writer, static_cast<uint8_t>(value ? 1 : 0));
}

//! Serializes a scoped enum as its underlying integral type.
template <typename T>
auto Store(AnyWriter& writer, const T value) -> Result<void>
  requires(std::is_scoped_enum_v<T>)
{
  return Store(writer, std::to_underlying(value));
}

//! Serializes a std::vector as a 32-bit length prefix followed by each element.
template <typename T>
auto Store(AnyWriter& writer, const std::vector<T>& value) -> Result<void>
{
  if (value.size() > limits::kMaxArrayLength) {
    return std::errc::message_size;
  }

  CHECK_RESULT(writer.WriteSequenceSize(
    static_cast<limits::SequenceSizeType>(value.size()),
    limits::kMaxArrayLength));

  for (const auto& item : value) {
    CHECK_RESULT(writer.Write(item));
  }
  return {};
}

} // namespace kestrel::serio
