#include "../src/bounded_cursor.hpp"
#include "../src/byte_writer.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace dslist;

TEST(BoundedCursorTests, ReadsBigEndianIntegers) {
    const std::vector<uint8_t> data = {0xAB, 0x12, 0x34, 0xDE, 0xAD, 0xBE, 0xEF};
    BoundedCursor cursor(data);

    auto [byte, word, value] = cursor.read<U8, U16, U32>();

    EXPECT_EQ(byte, 0xAB);
    EXPECT_EQ(word, 0x1234);
    EXPECT_EQ(value, 0xDEADBEEFu);
    EXPECT_TRUE(cursor.at_end());
}

TEST(BoundedCursorTests, SkipProducesNoValue) {
    const std::vector<uint8_t> data = {0x00, 0x00, 0x00, 0x02, 0xFF, 0xFF, 0xFF, 0xFF, 0x00, 0x00, 0x00, 0x07};
    BoundedCursor cursor(data);

    auto values = cursor.read<U32, Skip<4>, U32>();
    static_assert(std::tuple_size_v<decltype(values)> == 2);

    EXPECT_EQ(std::get<0>(values), 2u);
    EXPECT_EQ(std::get<1>(values), 7u);
}

TEST(BoundedCursorTests, BytesKeepsPadding) {
    const std::vector<uint8_t> data = {'T', 'e', 'l', '.', 0x00, 0x00};
    BoundedCursor cursor(data);

    auto [name] = cursor.read<Bytes<6>>();

    EXPECT_EQ(name.size(), 6u);
    EXPECT_EQ(trim_padding(name), "Tel.");
}

TEST(BoundedCursorTests, SequentialReadsAdvance) {
    const std::vector<uint8_t> data = {0x01, 0x02, 0x03};
    BoundedCursor cursor(data);

    EXPECT_EQ(std::get<0>(cursor.read<U8>()), 0x01);
    EXPECT_EQ(cursor.remaining(), 2u);
    EXPECT_EQ(std::get<0>(cursor.read<U16>()), 0x0203);
    EXPECT_EQ(cursor.remaining(), 0u);
}

TEST(BoundedCursorTests, UnderrunReportsRemainingAndRequested) {
    const std::vector<uint8_t> data = {0x00, 0x00, 0x01};
    BoundedCursor cursor(data);

    try {
        cursor.read<U32>();
        FAIL() << "Expected BufferUnderrun";
    } catch (const BufferUnderrun& e) {
        EXPECT_EQ(e.remaining(), 3u);
        EXPECT_EQ(e.requested(), 4u);
    }
}

TEST(BoundedCursorTests, FailedReadConsumesNothing) {
    const std::vector<uint8_t> data = {0x12, 0x34, 0x56};
    BoundedCursor cursor(data);

    // The descriptor as a whole is too wide, even though U16 alone would fit.
    EXPECT_THROW((cursor.read<U16, U16>()), BufferUnderrun);
    EXPECT_EQ(cursor.remaining(), 3u);

    auto [word] = cursor.read<U16>();
    EXPECT_EQ(word, 0x1234);
}

TEST(BoundedCursorTests, EmptyBuffer) {
    const std::vector<uint8_t> data;
    BoundedCursor cursor(data);

    EXPECT_TRUE(cursor.at_end());
    EXPECT_THROW(cursor.read<U8>(), BufferUnderrun);
}

TEST(BoundedCursorTests, TrimPaddingOnlyStripsTrailingNuls) {
    EXPECT_EQ(trim_padding(std::string("ab\0cd\0\0", 7)), std::string("ab\0cd", 5));
    EXPECT_EQ(trim_padding(std::string(16, '\0')), "");
    EXPECT_EQ(trim_padding("Front Desk"), "Front Desk");
}

// ============================================================================
// ByteWriter
// ============================================================================

TEST(ByteWriterTests, EmitsBigEndian) {
    ByteWriter out;
    out.emit(0x01);
    out.emitWord(0x8001);
    out.emitLong(0x0000000B);

    expectBytes(out.bytes(), {0x01, 0x80, 0x01, 0x00, 0x00, 0x00, 0x0B});
}

TEST(ByteWriterTests, FixedFieldsPadAndTruncate) {
    ByteWriter out;
    out.emitFixed("Tel", 4);
    out.emitFixed("Telephone", 4);

    expectBytes(out.bytes(), {'T', 'e', 'l', 0x00, 'T', 'e', 'l', 'e'});
}

TEST(ByteWriterTests, ReadsBackWhatWasWritten) {
    ByteWriter out;
    out.emitLong(42);
    out.emitWord(0x8001);
    out.emitZeros(3);
    out.emitFixed("Name", 8);
    const auto data = out.take();

    BoundedCursor cursor(data);
    auto [id, marker, name] = cursor.read<U32, U16, Skip<3>, Bytes<8>>();
    EXPECT_EQ(id, 42u);
    EXPECT_EQ(marker, 0x8001);
    EXPECT_EQ(trim_padding(name), "Name");
    EXPECT_TRUE(cursor.at_end());
}
