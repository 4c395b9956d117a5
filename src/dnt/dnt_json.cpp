/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "dnt/dnt_json.h"

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <utility>

namespace dntkit::dnt {
namespace {
int hex_nibble(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F') {
        return 10 + (c - 'A');
    }
    return -1;
}

std::string to_hex_u32(std::uint32_t v) {
    static const char hexdig[] = "0123456789ABCDEF";
    std::string out;
    out.resize(10);
    out[0] = '0';
    out[1] = 'x';
    for (int i = 0; i < 8; i++) {
        const int shift = 28 - (i * 4);
        out[2 + i] = hexdig[(v >> shift) & 0xFu];
    }
    return out;
}

std::uint32_t parse_hex_u32(std::string_view s) {
    if (s.size() != 10 || s[0] != '0' || (s[1] != 'x' && s[1] != 'X')) {
        throw std::runtime_error("Float bit pattern must look like 0x7FC00000: " + std::string(s));
    }
    std::uint32_t v = 0;
    for (std::size_t pos = 2; pos < s.size(); pos++) {
        const int n = hex_nibble(s[pos]);
        if (n < 0) {
            throw std::runtime_error(
                "Invalid hex character in float bit pattern: " + std::string(s)
            );
        }
        v = (v << 4) | static_cast<std::uint32_t>(n);
    }
    return v;
}

std::string cell_label(std::size_t row, std::size_t col) {
    return "rows[" + std::to_string(row) + "][" + std::to_string(col) + "]";
}

nlohmann::ordered_json value_to_json(const Value& value) {
    if (const auto* text = std::get_if<std::string>(&value)) {
        return latin1_to_utf8(*text);
    }
    if (const auto* i = std::get_if<std::int32_t>(&value)) {
        return *i;
    }
    const float f = std::get<float>(value);
    if (!std::isfinite(f)) {
        return to_hex_u32(std::bit_cast<std::uint32_t>(f));
    }
    return static_cast<double>(f);
}

Value value_from_json(
    const nlohmann::ordered_json& j,
    ValueType type,
    std::size_t row,
    std::size_t col
) {
    switch (type) {
        case ValueType::Text:
            if (!j.is_string()) {
                throw std::runtime_error(cell_label(row, col) + ": expected a string.");
            }
            return utf8_to_latin1(j.get<std::string>());
        case ValueType::Int32: {
            if (!j.is_number_integer()) {
                throw std::runtime_error(cell_label(row, col) + ": expected an integer.");
            }
            if (j.is_number_unsigned()) {
                const auto v = j.get<std::uint64_t>();
                if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max())) {
                    throw std::runtime_error(
                        cell_label(row, col) + ": integer out of Int32 range."
                    );
                }
                return static_cast<std::int32_t>(v);
            }
            const auto v = j.get<std::int64_t>();
            if (v < std::numeric_limits<std::int32_t>::min()
                || v > std::numeric_limits<std::int32_t>::max()) {
                throw std::runtime_error(cell_label(row, col) + ": integer out of Int32 range.");
            }
            return static_cast<std::int32_t>(v);
        }
        case ValueType::Float32:
            if (j.is_number()) {
                const double d = j.get<double>();
                if (std::isfinite(d) && std::fabs(d) > std::numeric_limits<float>::max()) {
                    throw std::runtime_error(
                        cell_label(row, col) + ": number out of Float32 range."
                    );
                }
                return static_cast<float>(d);
            }
            if (j.is_string()) {
                return std::bit_cast<float>(parse_hex_u32(j.get<std::string>()));
            }
            throw std::runtime_error(cell_label(row, col) + ": expected a number.");
    }
    throw std::invalid_argument("Invalid value type");
}

Column column_from_json(const nlohmann::ordered_json& j, std::size_t index) {
    const std::string label = "columns[" + std::to_string(index) + "]";
    if (!j.is_object()) {
        throw std::runtime_error(label + " must be an object.");
    }
    if (!j.contains("name") || !j.at("name").is_string()) {
        throw std::runtime_error(label + " is missing a string 'name'.");
    }
    std::string name = utf8_to_latin1(j.at("name").get<std::string>());

    std::optional<ValueType> named_type;
    if (j.contains("type")) {
        const auto& t = j.at("type");
        if (!t.is_string()) {
            throw std::runtime_error(label + ".type must be a string.");
        }
        named_type = parse_value_type_name(t.get<std::string>());
        if (!named_type.has_value()) {
            throw std::runtime_error(label + ": unknown type '" + t.get<std::string>() + "'.");
        }
    }

    if (j.contains("tag")) {
        const auto& t = j.at("tag");
        if (!t.is_number_integer() || t.get<std::int64_t>() < 0 || t.get<std::int64_t>() > 0xFF) {
            throw std::runtime_error(label + ".tag must be an integer in [0..255].");
        }
        Column column =
            make_column(std::move(name), static_cast<std::uint8_t>(t.get<std::int64_t>()));
        if (named_type.has_value() && *named_type != column.type) {
            throw std::runtime_error(
                label + ": type " + std::string(value_type_name(*named_type))
                + " disagrees with tag " + std::to_string(column.raw_tag) + "."
            );
        }
        return column;
    }

    if (!named_type.has_value()) {
        throw std::runtime_error(label + " needs a 'tag' or a 'type'.");
    }
    return Column{std::move(name), *named_type, default_type_tag(*named_type)};
}
}  // namespace

std::string latin1_to_utf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (const char ch : bytes) {
        const auto c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return out;
}

std::string utf8_to_latin1(std::string_view utf8) {
    std::string out;
    out.reserve(utf8.size());
    std::size_t pos = 0;
    while (pos < utf8.size()) {
        const auto lead = static_cast<unsigned char>(utf8[pos]);
        int extra = 0;
        std::uint32_t cp = 0;
        if (lead < 0x80) {
            cp = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            cp = lead & 0x1Fu;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            cp = lead & 0x0Fu;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            cp = lead & 0x07u;
        } else {
            throw std::runtime_error("Invalid UTF-8 lead byte at offset " + std::to_string(pos));
        }
        if (static_cast<std::size_t>(extra) > utf8.size() - pos - 1) {
            throw std::runtime_error("Truncated UTF-8 sequence at offset " + std::to_string(pos));
        }
        for (int i = 1; i <= extra; i++) {
            const auto cont = static_cast<unsigned char>(utf8[pos + static_cast<std::size_t>(i)]);
            if ((cont & 0xC0) != 0x80) {
                throw std::runtime_error(
                    "Invalid UTF-8 continuation byte at offset " + std::to_string(pos + i)
                );
            }
            cp = (cp << 6) | (cont & 0x3Fu);
        }
        out.push_back(static_cast<char>(cp & 0xFFu));
        pos += 1 + static_cast<std::size_t>(extra);
    }
    return out;
}

nlohmann::ordered_json table_to_json(const Table& table) {
    nlohmann::ordered_json doc = nlohmann::ordered_json::object();

    auto columns = nlohmann::ordered_json::array();
    for (const auto& column : table.head) {
        nlohmann::ordered_json c = nlohmann::ordered_json::object();
        c["name"] = latin1_to_utf8(column.name);
        c["type"] = std::string(value_type_name(column.type));
        c["tag"] = column.raw_tag;
        columns.push_back(std::move(c));
    }
    doc["columns"] = std::move(columns);

    auto rows = nlohmann::ordered_json::array();
    for (const auto& row : table.body) {
        auto values = nlohmann::ordered_json::array();
        for (const auto& value : row.values) {
            values.push_back(value_to_json(value));
        }
        rows.push_back(std::move(values));
    }
    doc["rows"] = std::move(rows);
    return doc;
}

nlohmann::ordered_json table_to_minimal_json(const Table& table) {
    auto rows = nlohmann::ordered_json::array();
    for (const auto& row : table.body) {
        nlohmann::ordered_json obj = nlohmann::ordered_json::object();
        const std::size_t n = std::min(row.values.size(), table.head.size());
        for (std::size_t c = 0; c < n; c++) {
            obj[latin1_to_utf8(table.head[c].name)] = value_to_json(row.values[c]);
        }
        rows.push_back(std::move(obj));
    }
    return rows;
}

Table table_from_json(const nlohmann::ordered_json& doc) {
    if (!doc.is_object()) {
        throw std::runtime_error("DNT JSON root must be an object.");
    }
    if (!doc.contains("columns") || !doc.at("columns").is_array()) {
        throw std::runtime_error("DNT JSON is missing the 'columns' array.");
    }
    if (!doc.contains("rows") || !doc.at("rows").is_array()) {
        throw std::runtime_error("DNT JSON is missing the 'rows' array.");
    }

    Table table{};
    const auto& columns = doc.at("columns");
    table.head.reserve(columns.size());
    for (std::size_t i = 0; i < columns.size(); i++) {
        table.head.push_back(column_from_json(columns.at(i), i));
    }

    const auto& rows = doc.at("rows");
    table.body.reserve(rows.size());
    for (std::size_t r = 0; r < rows.size(); r++) {
        const auto& values = rows.at(r);
        if (!values.is_array()) {
            throw std::runtime_error("rows[" + std::to_string(r) + "] must be an array.");
        }
        if (values.size() != table.head.size()) {
            throw std::runtime_error(
                "rows[" + std::to_string(r) + "] has " + std::to_string(values.size())
                + " values, expected " + std::to_string(table.head.size()) + "."
            );
        }
        Row row{};
        row.values.reserve(values.size());
        for (std::size_t c = 0; c < values.size(); c++) {
            row.values.push_back(value_from_json(values.at(c), table.head[c].type, r, c));
        }
        table.body.push_back(std::move(row));
    }
    return table;
}

}  // namespace dntkit::dnt
