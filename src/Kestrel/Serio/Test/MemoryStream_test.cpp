//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <array>
#include <cstddef>
#include <system_error>

#include <Kestrel/Testing/GTest.h>

#include <Kestrel/Serio/MemoryStream.h>

using kestrel::serio::MemoryStream;

namespace {

constexpr std::array<std::byte, 3> kAbc {
  std::byte { 'a' },
  std::byte { 'b' },
  std::byte { 'c' },
};

//=== MemoryStream (internal buffer) tests ===--------------------------------//

//! Writing to an internal buffer grows it and advances the position.
NOLINT_TEST(MemoryStreamTest, Internal_WriteGrowsBuffer)
{
  // Arrange
  MemoryStream sut;

  // Act
  const auto write_result = sut.Write(kAbc);

  // Assert
  EXPECT_TRUE(write_result);
  EXPECT_EQ(sut.Size().value(), 3U);
  EXPECT_EQ(sut.Position().value(), 3U);
}

//! Reading back after a reset returns the written bytes.
NOLINT_TEST(MemoryStreamTest, Internal_ReadAfterReset)
{
  // Arrange
  MemoryStream sut;
  ASSERT_TRUE(sut.Write(kAbc));
  sut.Reset();
  std::array<std::byte, 3> out {};

  // Act
  const auto read_result = sut.Read(out.data(), out.size());

  // Assert
  EXPECT_TRUE(read_result);
  EXPECT_EQ(out, kAbc);
}

//! A short read fails and does not move the position.
NOLINT_TEST(MemoryStreamTest, Read_PastEndFails)
{
  // Arrange
  MemoryStream sut;
  ASSERT_TRUE(sut.Write(kAbc));
  ASSERT_TRUE(sut.Seek(2));
  std::array<std::byte, 2> out {};

  // Act
  const auto read_result = sut.Read(out.data(), out.size());

  // Assert
  ASSERT_FALSE(read_result);
  EXPECT_EQ(
    read_result.error(), std::make_error_code(std::errc::io_error));
  EXPECT_EQ(sut.Position().value(), 2U);
}

NOLINT_TEST(MemoryStreamTest, Seek_PastEndFails)
{
  // Arrange
  MemoryStream sut;
  ASSERT_TRUE(sut.Write(kAbc));

  // Act
  const auto seek_result = sut.Seek(4);

  // Assert
  ASSERT_FALSE(seek_result);
  EXPECT_EQ(
    seek_result.error(), std::make_error_code(std::errc::invalid_seek));
}

NOLINT_TEST(MemoryStreamTest, NullPointerIsInvalid)
{
  MemoryStream sut;
  const auto result = sut.Write(nullptr, 1);
  ASSERT_FALSE(result);
  EXPECT_EQ(
    result.error(), std::make_error_code(std::errc::invalid_argument));
}

NOLINT_TEST(MemoryStreamTest, Internal_ClearDropsContent)
{
  // Arrange
  MemoryStream sut;
  ASSERT_TRUE(sut.Write(kAbc));

  // Act
  sut.Clear();

  // Assert
  EXPECT_EQ(sut.Size().value(), 0U);
  EXPECT_EQ(sut.Position().value(), 0U);
}

//=== MemoryStream (external buffer) tests ===--------------------------------//

//! Fixture for MemoryStream tests using an external buffer.
class ExternalMemoryStreamTest : public testing::Test {
protected:
  std::array<std::byte, 4> buffer_ {};
  MemoryStream sut_ { std::span(buffer_) };
};

NOLINT_TEST_F(ExternalMemoryStreamTest, WritesIntoExternalBuffer)
{
  // Act
  const auto write_result = sut_.Write(kAbc);

  // Assert
  EXPECT_TRUE(write_result);
  EXPECT_EQ(sut_.Size().value(), 4U);
  EXPECT_EQ(buffer_[0], std::byte { 'a' });
  EXPECT_EQ(buffer_[2], std::byte { 'c' });
}

//! An external buffer never grows.
NOLINT_TEST_F(ExternalMemoryStreamTest, Write_OverflowFails)
{
  // Arrange
  ASSERT_TRUE(sut_.Write(kAbc));

  // Act
  const auto write_result = sut_.Write(kAbc);

  // Assert
  ASSERT_FALSE(write_result);
  EXPECT_EQ(write_result.error(),
    std::make_error_code(std::errc::no_buffer_space));
  EXPECT_EQ(sut_.Position().value(), 3U);
}

NOLINT_TEST_F(ExternalMemoryStreamTest, Clear_ZeroesBuffer)
{
  // Arrange
  ASSERT_TRUE(sut_.Write(kAbc));

  // Act
  sut_.Clear();

  // Assert
  EXPECT_EQ(buffer_, (std::array<std::byte, 4> {}));
  EXPECT_EQ(sut_.Position().value(), 0U);
}

} // namespace
