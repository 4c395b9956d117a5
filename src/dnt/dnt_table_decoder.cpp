/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "dnt/dnt_table_decoder.h"

#include <algorithm>

namespace dntkit::dnt {
namespace {
Value read_value(ByteReader& reader, ValueType type) {
    switch (type) {
        case ValueType::Text:
            return reader.read_string();
        case ValueType::Int32:
            return reader.read_i32_le();
        case ValueType::Float32:
            return reader.read_f32_le();
    }
    throw std::invalid_argument("Invalid value type");
}

void check_sentinel(ByteReader& reader) {
    const std::size_t at = reader.position();
    if (reader.remaining() < 1 + kSentinel.size()) {
        throw FormatError(
            ErrorCode::BadSentinel,
            "Missing THEND sentinel at offset " + std::to_string(at) + "."
        );
    }
    const std::uint8_t len = reader.read_u8();
    const auto text = reader.read_bytes(kSentinel.size());
    const bool matches = len == kSentinel.size()
                         && std::equal(text.begin(), text.end(), kSentinel.begin(), kSentinel.end(),
                                       [](std::uint8_t b, char c) {
                                           return b == static_cast<std::uint8_t>(c);
                                       });
    if (!matches) {
        throw FormatError(
            ErrorCode::BadSentinel, "Corrupt THEND sentinel at offset " + std::to_string(at) + "."
        );
    }
}
}  // namespace

Table decode_table(ByteReader& reader, DecodeOptions options) {
    reader.seek(kReservedPrefixSize);

    Table table = make_empty_table();

    const std::uint16_t wire_columns = reader.read_u16_le();
    const std::uint32_t rows = reader.read_u32_le();

    table.head.reserve(static_cast<std::size_t>(wire_columns) + 1);
    for (std::uint16_t i = 0; i < wire_columns; i++) {
        std::string name = reader.read_string();
        const std::uint8_t raw_tag = reader.read_u8();
        table.head.push_back(make_column(std::move(name), raw_tag));
    }

    // Each row holds at least its 4-byte id.
    if (rows <= reader.remaining() / 4) {
        table.body.reserve(rows);
    }
    for (std::uint32_t r = 0; r < rows; r++) {
        Row row{};
        row.values.reserve(table.head.size());
        for (const auto& column : table.head) {
            row.values.push_back(read_value(reader, column.type));
        }
        table.body.push_back(std::move(row));
    }

    if (options.validate_sentinel) {
        check_sentinel(reader);
    }
    return table;
}

Table decode_table(std::span<const std::uint8_t> bytes, DecodeOptions options) {
    ByteReader reader(bytes);
    return decode_table(reader, options);
}

}  // namespace dntkit::dnt
