/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "dnt/dnt_type_tag.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dntkit::dnt {

// Text holds one byte per character.
using Value = std::variant<std::string, std::int32_t, float>;

struct Column {
    std::string name;
    ValueType type = ValueType::Int32;
    std::uint8_t raw_tag = kTagInt32;
};

struct Row {
    std::vector<Value> values;
};

struct Table {
    std::vector<Column> head;
    std::vector<Row> body;
};

inline constexpr std::string_view kIdColumnName = "id";

Column make_id_column();
Column make_column(std::string name, std::uint8_t raw_tag);

// A table holding only the implicit id column and no rows.
Table make_empty_table();

bool is_id_column(const Column& column);

// Names carried by more than one column, each listed once in header order.
std::vector<std::string> duplicate_column_names(const Table& table);

ValueType value_type_of(const Value& value);

// Float32 values compare by bit pattern.
bool values_identical(const Value& a, const Value& b);

bool operator==(const Column& a, const Column& b);
bool operator==(const Row& a, const Row& b);
bool operator==(const Table& a, const Table& b);

/**
 * Checks everything the encoder relies on: id column at index 0, tags that
 * resolve to their column types, u16/u32 count limits, string lengths, and row
 * shapes. Throws ContractViolation naming the first offending entry.
 */
void validate_table(const Table& table);

}  // namespace dntkit::dnt
