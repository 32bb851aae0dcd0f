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

//! Abstract interface for binary data readers supporting type-erased access.
/*!
 Counterpart of `AnyWriter`: values are expected packed and little-endian.
 `Load` overloads validate what they read and fail with
 `std::errc::invalid_argument` on values that cannot be represented.
*/
class AnyReader {
public:
  AnyReader() = default;

  virtual ~AnyReader() = default;

  KESTREL_DEFAULT_COPYABLE(AnyReader)
  KESTREL_DEFAULT_MOVABLE(AnyReader)

  [[nodiscard]] virtual auto ReadBlobInto(std::span<std::byte> buffer) noexcept
    -> Result<void>
    = 0;

  [[nodiscard]] auto ReadSequenceSize(limits::SequenceSizeType& size,
    limits::SequenceSizeType max_size) noexcept -> Result<void>
  {
    CHECK_RESULT(ReadInto(size));
    if (size > max_size) {
      size = 0;
      return std::errc::value_too_large;
    }
    return {};
  }

  [[nodiscard]] virtual auto Position() noexcept -> Result<size_t> = 0;

  [[nodiscard]] virtual auto Seek(size_t pos) noexcept -> Result<void> = 0;

  template <typename T> [[nodiscard]] auto Read() noexcept -> Result<T>
  {
    T value {};
    CHECK_RESULT(ReadInto(value));
    return value;
  }

  //! Deserialize into `value` with the `Load` overload found for `T`.
  template <typename T>
  [[nodiscard]] auto ReadInto(T& value) noexcept -> Result<void>
  {
    try {
      return Load(*this, value);
    } catch (const std::exception& ex) {
      LOG_F(ERROR, "ADL specialization of Load failed: {}", ex.what());
      return std::errc::io_error;
    }
  }
};

//! Concrete binary reader for a specific stream type.
/*!
 ```cpp
 MemoryStream stream;
 Reader<MemoryStream> reader(stream);
 const auto value = reader.Read<uint16_t>();
 ```

 @tparam S Stream type implementing the Stream concept.
 @see AnyReader, Load, MemoryStream
*/
template <Stream S> class Reader : public AnyReader {
public:
  explicit Reader(S& stream) noexcept
    : stream_(stream)
  {
  }

  ~Reader() override = default;

  KESTREL_MAKE_NON_COPYABLE(Reader)
  KESTREL_MAKE_NON_MOVABLE(Reader)

  [[nodiscard]] auto ReadBlobInto(std::span<std::byte> buffer) noexcept
    -> Result<void> override
  {
    return stream_.get().Read(buffer.data(), buffer.size());
  }

  [[nodiscard]] auto Position() noexcept -> Result<size_t> override
  {
    return stream_.get().Position();
  }

  [[nodiscard]] auto Seek(size_t pos) noexcept -> Result<void> override
  {
    return stream_.get().Seek(pos);
  }

private:
  std::reference_wrapper<S> stream_;
};

//=== Load specializations ===------------------------------------------------//

//! Deserializes a little-endian integral value (except bool).
template <typename T>
auto Load(AnyReader& reader, T& value) -> Result<void>
  requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
{
  static_assert(std::has_unique_object_representations_v<T>,
    "Type may have platform-dependent representation");
  CHECK_RESULT(reader.ReadBlobInto(
    // NOLINTNEXTLINE(*-reinterpret-cast)
    std::span(reinterpret_cast<std::byte*>(&value), sizeof(T))));
  if constexpr (std::endian::native == std::endian::big && sizeof(T) > 1) {
    value = std::byteswap(value);
  }
  return {};
}

//! Deserializes a bool stored as a single byte; only 0 and 1 are accepted.
inline auto Load(AnyReader& reader, bool& value) -> Result<void>
{
  uint8_t raw { 0 };
  CHECK_RESULT(Load(reader, raw));
  if (raw > 1) {
    return std::errc::invalid_argument;
  }
  value = raw == 1;
  return {};
}

//! Deserializes a scoped enum stored as its underlying integral type.
/*!
 @note The value is not checked against the enumerators; callers that need a
       valid enumerator validate it after loading.
*/
template <typename T>
auto Load(AnyReader& reader, T& value) -> Result<void>
  requires(std::is_scoped_enum_v<T>)
{
  std::underlying_type_t<T> raw { 0 };
  CHECK_RESULT(Load(reader, raw));
  value = static_cast<T>(raw);
  return {};
}

//! Deserializes a std::vector stored as a 32-bit length prefix followed by
//! each element.
/*!
 @note `value` is only replaced once every element has been read; on failure
       it keeps its previous content.
*/
template <typename T>
auto Load(AnyReader& reader, std::vector<T>& value) -> Result<void>
{
  limits::SequenceSizeType length = 0;
  CHECK_RESULT(reader.ReadSequenceSize(length, limits::kMaxArrayLength));

  std::vector<T> elements;
  elements.reserve(length);
  for (limits::SequenceSizeType i = 0; i < length; ++i) {
    T element {};
    CHECK_RESULT(reader.ReadInto(element));
    elements.push_back(std::move(element));
  }
  value.swap(elements);
  return {};
}

} // namespace kestrel::serio
