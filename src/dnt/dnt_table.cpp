/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "dnt/dnt_table.h"
#include "dnt/dnt_error.h"

#include <algorithm>
#include <bit>
#include <limits>
#include <utility>

namespace dntkit::dnt {
namespace {
constexpr std::size_t kMaxStringBytes = std::numeric_limits<std::uint16_t>::max();

std::string column_label(const Table& table, std::size_t index) {
    return "column " + std::to_string(index) + " ('" + table.head[index].name + "')";
}
}  // namespace

Column make_id_column() {
    return Column{std::string(kIdColumnName), ValueType::Int32, kTagInt32};
}

Column make_column(std::string name, std::uint8_t raw_tag) {
    return Column{std::move(name), resolve_type_tag(raw_tag), raw_tag};
}

Table make_empty_table() {
    Table table{};
    table.head.push_back(make_id_column());
    return table;
}

bool is_id_column(const Column& column) {
    return column.name == kIdColumnName && column.type == ValueType::Int32
           && column.raw_tag == kTagInt32;
}

std::vector<std::string> duplicate_column_names(const Table& table) {
    std::vector<std::string> out;
    for (std::size_t i = 0; i < table.head.size(); i++) {
        const auto& name = table.head[i].name;
        if (std::find(out.begin(), out.end(), name) != out.end()) {
            continue;
        }
        for (std::size_t j = i + 1; j < table.head.size(); j++) {
            if (table.head[j].name == name) {
                out.push_back(name);
                break;
            }
        }
    }
    return out;
}

ValueType value_type_of(const Value& value) {
    switch (value.index()) {
        case 0:
            return ValueType::Text;
        case 1:
            return ValueType::Int32;
        default:
            return ValueType::Float32;
    }
}

bool values_identical(const Value& a, const Value& b) {
    if (a.index() != b.index()) {
        return false;
    }
    if (const auto* fa = std::get_if<float>(&a)) {
        return std::bit_cast<std::uint32_t>(*fa)
               == std::bit_cast<std::uint32_t>(std::get<float>(b));
    }
    return a == b;
}

bool operator==(const Column& a, const Column& b) {
    return a.name == b.name && a.type == b.type && a.raw_tag == b.raw_tag;
}

bool operator==(const Row& a, const Row& b) {
    if (a.values.size() != b.values.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.values.size(); i++) {
        if (!values_identical(a.values[i], b.values[i])) {
            return false;
        }
    }
    return true;
}

bool operator==(const Table& a, const Table& b) {
    return a.head == b.head && a.body == b.body;
}

void validate_table(const Table& table) {
    if (table.head.empty()) {
        throw ContractViolation("Table header is empty; the id column is required.");
    }
    if (!is_id_column(table.head.front())) {
        throw ContractViolation(
            "Header index 0 must be the implicit id column (id, Int32, tag 3), got '"
            + table.head.front().name + "'."
        );
    }
    if (table.head.size() - 1 > std::numeric_limits<std::uint16_t>::max()) {
        throw ContractViolation(
            "Too many columns: " + std::to_string(table.head.size()) + " (limit 65536)."
        );
    }
    if (table.body.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw ContractViolation("Too many rows: " + std::to_string(table.body.size()) + ".");
    }

    for (std::size_t c = 0; c < table.head.size(); c++) {
        const auto& column = table.head[c];
        const auto resolved = try_resolve_type_tag(column.raw_tag);
        if (!resolved.has_value() || *resolved != column.type) {
            throw ContractViolation(
                column_label(table, c) + " declares " + std::string(value_type_name(column.type))
                + " but carries raw tag " + std::to_string(column.raw_tag) + "."
            );
        }
        if (column.name.size() > kMaxStringBytes) {
            throw ContractViolation(column_label(table, c) + " name exceeds 65535 bytes.");
        }
    }

    for (std::size_t r = 0; r < table.body.size(); r++) {
        const auto& values = table.body[r].values;
        if (values.size() != table.head.size()) {
            throw ContractViolation(
                "Row " + std::to_string(r) + " has " + std::to_string(values.size())
                + " values, header has " + std::to_string(table.head.size()) + " columns."
            );
        }
        for (std::size_t c = 0; c < values.size(); c++) {
            const ValueType actual = value_type_of(values[c]);
            if (actual != table.head[c].type) {
                throw ContractViolation(
                    "Row " + std::to_string(r) + ", " + column_label(table, c) + ": expected "
                    + std::string(value_type_name(table.head[c].type)) + ", got "
                    + std::string(value_type_name(actual)) + "."
                );
            }
            if (const auto* text = std::get_if<std::string>(&values[c]);
                text != nullptr && text->size() > kMaxStringBytes) {
                throw ContractViolation(
                    "Row " + std::to_string(r) + ", " + column_label(table, c)
                    + ": text exceeds 65535 bytes."
                );
            }
        }
    }
}

}  // namespace dntkit::dnt
