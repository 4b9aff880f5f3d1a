// tests/test_buffer_view.cpp
#include "core/buffer/BufferView.hpp"
#include "core/buffer/OwnedBuffer.hpp"
#include "core/record/RecordHeader.hpp"

#include <gtest/gtest.h>
#include <array>
#include <cstring>
#include <stdexcept>
#include <string_view>

using namespace stridedb::core;

TEST(BufferView, LittleEndianRoundTrip) {
    auto owned = OwnedBuffer::allocate(32);
    owned.zero_fill();
    const auto view = owned.view();

    view.write_u16_le(0, 0x1234);
    view.write_u32_le(2, 0xDEADBEEF);
    view.write_u64_le(8, 0x0102030405060708ULL);

    EXPECT_EQ(view.read_u16_le(0), 0x1234);
    EXPECT_EQ(view.read_u32_le(2), 0xDEADBEEFu);
    EXPECT_EQ(view.read_u64_le(8), 0x0102030405060708ULL);

    // Least significant byte first
    EXPECT_EQ(view.read_u8(0), 0x34);
    EXPECT_EQ(view.read_u8(1), 0x12);
    EXPECT_EQ(view.read_u8(8), 0x08);
}

TEST(BufferView, OutOfBoundsAccessThrows) {
    auto owned = OwnedBuffer::allocate(8);
    const auto view = owned.view();

    EXPECT_THROW((void)view.read_u64_le(1), std::out_of_range);
    EXPECT_THROW(view.write_u32_le(6, 1), std::out_of_range);
    EXPECT_THROW((void)view.slice(4, 8), std::out_of_range);
}

TEST(BufferView, ReadOnlyViewRejectsWrites) {
    std::array<std::byte, 16> storage{};
    const auto view = BufferView::read_only(storage.data(), storage.size());

    EXPECT_FALSE(view.is_mutable());
    EXPECT_THROW(view.write_u8(0, 1), std::logic_error);
    EXPECT_THROW(view.write_ascii(0, "abc"), std::logic_error);
    EXPECT_EQ(view.read_u8(0), 0);
}

TEST(BufferView, SliceKeepsCapabilities) {
    auto owned = OwnedBuffer::allocate(64);
    const auto view = owned.view();
    ASSERT_TRUE(view.is_atomic());

    const auto slice = view.slice(8, 16);
    EXPECT_EQ(slice.size(), 16u);
    EXPECT_TRUE(slice.is_mutable());
    EXPECT_TRUE(slice.is_atomic());

    slice.write_u32_le(0, 77);
    EXPECT_EQ(view.read_u32_le(8), 77u);

    EXPECT_FALSE(view.as_read_only().slice(0, 4).is_mutable());
}

TEST(BufferView, WriteAsciiReplacesNonAscii) {
    auto owned = OwnedBuffer::allocate(8);
    owned.zero_fill();
    const auto view = owned.view();

    view.write_ascii(0, "a\xC3\xA9z");
    EXPECT_EQ(view.as_string_view(0, 4), "a??z");
}

TEST(BufferView, FetchAddRequiresAtomicCapability) {
    auto owned = OwnedBuffer::allocate(16);
    owned.zero_fill();

    const auto atomic = owned.view();
    EXPECT_TRUE(atomic.can_fetch_add(8, 8));
    EXPECT_FALSE(atomic.can_fetch_add(3, 4)); // misaligned

    EXPECT_EQ(atomic.fetch_add_u32(0, 5), 0u);
    EXPECT_EQ(atomic.fetch_add_u32(0, 1), 5u);
    EXPECT_EQ(atomic.read_u32_le(0), 6u);

    const BufferView plain{owned.data(), owned.size()};
    EXPECT_FALSE(plain.can_fetch_add(0, 4));
    EXPECT_THROW((void)plain.fetch_add_u32(0, 1), std::logic_error);
}

TEST(BufferView, Crc32cMatchesKnownVector) {
    constexpr std::string_view check = "123456789";
    auto owned = OwnedBuffer::allocate(check.size());
    owned.view().write_ascii(0, check);

    EXPECT_EQ(owned.view().crc32c(), 0xE3069283u);
}

TEST(BufferView, Crc32MatchesKnownVector) {
    constexpr std::string_view check = "123456789";
    auto owned = OwnedBuffer::allocate(check.size());
    owned.view().write_ascii(0, check);

    EXPECT_EQ(owned.view().crc32(), 0xCBF43926u);
    EXPECT_EQ(owned.view().crc32(0, 0), 0u);
    EXPECT_NE(owned.view().crc32(), owned.view().crc32c());
}

TEST(OwnedBuffer, AllocateAlignsAndMoves) {
    auto owned = OwnedBuffer::allocate(100, 64);
    EXPECT_EQ(owned.size(), 100u);
    EXPECT_EQ(reinterpret_cast<uintptr_t>(owned.data()) % 64, 0u);

    auto* data = owned.data();
    OwnedBuffer moved = std::move(owned);
    EXPECT_EQ(moved.data(), data);

    EXPECT_THROW((void)OwnedBuffer::allocate(16, 3), std::invalid_argument);
    EXPECT_TRUE(OwnedBuffer::allocate(0).empty());
}

TEST(RecordHeader, EncodesLittleEndian) {
    auto owned = OwnedBuffer::allocate(RecordHeader::SIZE);
    owned.zero_fill();
    const RecordHeader header{7, -2, 42};

    header.write_to(owned.view(), 0);
    EXPECT_EQ(owned.view().read_u16_le(RecordHeader::TYPE_ID_OFFSET), 7);
    EXPECT_EQ(owned.view().read_u16_le(RecordHeader::GROUP_ID_OFFSET), 0xFFFE);
    EXPECT_EQ(owned.view().read_u32_le(RecordHeader::BODY_LENGTH_OFFSET), 42u);

    EXPECT_EQ(RecordHeader::read_from(owned.view(), 0), header);
}
