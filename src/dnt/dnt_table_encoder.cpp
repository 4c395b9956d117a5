/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "dnt/dnt_table_encoder.h"
#include "dnt/dnt_table_decoder.h"

#include <string>
#include <type_traits>
#include <variant>

namespace dntkit::dnt {
namespace {
void write_value(ByteWriter& out, const Value& value) {
    std::visit(
        [&out](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                out.write_string(v);
            } else if constexpr (std::is_same_v<T, std::int32_t>) {
                out.write_i32_le(v);
            } else {
                out.write_f32_le(v);
            }
        },
        value
    );
}
}  // namespace

void encode_table(const Table& table, ByteWriter& out) {
    validate_table(table);

    for (std::size_t i = 0; i < kReservedPrefixSize; i++) {
        out.write_u8(0);
    }

    out.write_u16_le(static_cast<std::uint16_t>(table.head.size() - 1));
    out.write_u32_le(static_cast<std::uint32_t>(table.body.size()));

    for (std::size_t c = 1; c < table.head.size(); c++) {
        const auto& column = table.head[c];
        out.write_string(column.name);
        out.write_u8(column.raw_tag);
    }

    for (const auto& row : table.body) {
        for (const auto& value : row.values) {
            write_value(out, value);
        }
    }

    out.write_u8(static_cast<std::uint8_t>(kSentinel.size()));
    out.write_chars(kSentinel);
}

std::vector<std::uint8_t> encode_table(const Table& table) {
    ByteWriter out;
    encode_table(table, out);
    return out.take_bytes();
}

}  // namespace dntkit::dnt
