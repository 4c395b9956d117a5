/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "dnt/dnt_byte_writer.h"
#include "dnt/dnt_error.h"
#include "dnt/dnt_table_decoder.h"
#include "dnt/dnt_table_encoder.h"
#include "dnt_test_util.h"

#include <gtest/gtest.h>

using namespace dntkit::dnt;
using dntkit::dnt::test::bytes_of;

namespace {
// Header with the given wire columns and row count, no rows.
ByteWriter header_writer(std::uint16_t wire_columns, std::uint32_t rows) {
    ByteWriter bw;
    bw.write_u32_le(0);
    bw.write_u16_le(wire_columns);
    bw.write_u32_le(rows);
    return bw;
}
}  // namespace

TEST(TableDecoder, DecodesSingleIdRow) {
    const auto data = bytes_of({
        0x00, 0x00, 0x00, 0x00,  // reserved
        0x00, 0x00,              // no wire columns
        0x01, 0x00, 0x00, 0x00,  // one row
        0x41, 0x00, 0x00, 0x00,  // id = 65
    });
    const Table table = decode_table(data);

    Table expected = make_empty_table();
    expected.body.push_back(Row{{std::int32_t{65}}});
    EXPECT_EQ(table, expected);
}

TEST(TableDecoder, DecodesEmptyTable) {
    const auto data = bytes_of(
        {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0x05, 'T', 'H', 'E', 'N', 'D'}
    );
    ASSERT_EQ(data.size(), 16u);
    EXPECT_EQ(decode_table(data), make_empty_table());
    EXPECT_EQ(decode_table(data, DecodeOptions{.validate_sentinel = true}), make_empty_table());
}

TEST(TableDecoder, ReservedPrefixIsNotInterpreted) {
    const auto data = bytes_of({0xDE, 0xAD, 0xBE, 0xEF, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00});
    EXPECT_EQ(decode_table(data), make_empty_table());
}

TEST(TableDecoder, DecodesColumnsAndTypedValues) {
    ByteWriter bw = header_writer(3, 2);
    bw.write_string("name");
    bw.write_u8(1);
    bw.write_string("level");
    bw.write_u8(2);
    bw.write_string("rate");
    bw.write_u8(4);

    bw.write_i32_le(7);
    bw.write_string("Alice");
    bw.write_i32_le(10);
    bw.write_f32_le(0.5f);

    bw.write_i32_le(8);
    bw.write_string("");
    bw.write_i32_le(-3);
    bw.write_f32_le(-1.25f);

    const Table table = decode_table(bw.bytes());

    ASSERT_EQ(table.head.size(), 4u);
    EXPECT_TRUE(is_id_column(table.head[0]));
    EXPECT_EQ(table.head[1], (Column{"name", ValueType::Text, 1}));
    EXPECT_EQ(table.head[2], (Column{"level", ValueType::Int32, 2}));
    EXPECT_EQ(table.head[3], (Column{"rate", ValueType::Float32, 4}));

    ASSERT_EQ(table.body.size(), 2u);
    EXPECT_EQ(table.body[0], (Row{{std::int32_t{7}, std::string("Alice"), std::int32_t{10}, 0.5f}}));
    EXPECT_EQ(table.body[1], (Row{{std::int32_t{8}, std::string(""), std::int32_t{-3}, -1.25f}}));
}

TEST(TableDecoder, RejectsUnknownTypeTags) {
    for (const std::uint8_t tag : {std::uint8_t{0}, std::uint8_t{6}}) {
        ByteWriter bw = header_writer(1, 0);
        bw.write_string("broken");
        bw.write_u8(tag);
        try {
            decode_table(bw.bytes());
            FAIL() << "tag " << static_cast<int>(tag) << " decoded";
        } catch (const UnknownTypeTagError& e) {
            EXPECT_EQ(e.tag(), tag);
        }
    }
}

TEST(TableDecoder, EveryTruncationBeforeTheSentinelIsAnIoError) {
    const auto full = encode_table(test::make_sample_table());
    const std::size_t body_end = full.size() - 1 - kSentinel.size();
    for (std::size_t n = 0; n < body_end; n++) {
        const std::span<const std::uint8_t> cut(full.data(), n);
        EXPECT_THROW(decode_table(cut), IoError) << "length " << n;
    }
    const std::span<const std::uint8_t> body(full.data(), body_end);
    EXPECT_EQ(decode_table(body), test::make_sample_table());
}

TEST(TableDecoder, HugeRowCountWithoutDataIsAnIoError) {
    ByteWriter bw = header_writer(0, 0xFFFFFFFFu);
    bw.write_i32_le(1);
    EXPECT_THROW(decode_table(bw.bytes()), IoError);
}

TEST(TableDecoder, SentinelIsIgnoredByDefault) {
    ByteWriter bw = header_writer(0, 0);
    bw.write_chars("garbage");
    EXPECT_EQ(decode_table(bw.bytes()), make_empty_table());
}

TEST(TableDecoder, ValidatesSentinelWhenAsked) {
    const DecodeOptions strict{.validate_sentinel = true};
    auto data = encode_table(test::make_sample_table());
    EXPECT_EQ(decode_table(data, strict), test::make_sample_table());

    auto expect_bad_sentinel = [&strict](std::span<const std::uint8_t> bytes) {
        try {
            decode_table(bytes, strict);
            FAIL() << "bad sentinel accepted";
        } catch (const FormatError& e) {
            EXPECT_EQ(e.code(), ErrorCode::BadSentinel);
        }
    };

    auto corrupt = data;
    corrupt.back() = 'X';
    expect_bad_sentinel(corrupt);

    auto wrong_length = data;
    wrong_length[wrong_length.size() - 6] = 4;
    expect_bad_sentinel(wrong_length);

    expect_bad_sentinel(std::span<const std::uint8_t>(data.data(), data.size() - 1));
    expect_bad_sentinel(std::span<const std::uint8_t>(data.data(), data.size() - 6));
}

TEST(TableDecoder, ReaderOverloadLeavesCursorAfterLastRow) {
    const auto data = encode_table(make_empty_table());
    ByteReader br(data);
    decode_table(br);
    EXPECT_EQ(br.position(), 10u);

    ByteReader strict_reader(data);
    decode_table(strict_reader, DecodeOptions{.validate_sentinel = true});
    EXPECT_EQ(strict_reader.remaining(), 0u);
}
