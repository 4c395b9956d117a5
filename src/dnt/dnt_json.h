/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "dnt/dnt_table.h"

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace dntkit::dnt {

/**
 * Lossless JSON view of a table:
 *   { "columns": [ { "name", "type", "tag" }, ... ], "rows": [ [ ... ], ... ] }
 * Text bytes are emitted as Latin-1 code points. Non-finite floats are emitted
 * as "0x" plus the 8 hex digits of their bit pattern.
 */
nlohmann::ordered_json table_to_json(const Table& table);

// One object per row keyed by column name. Drops tags, so it cannot be encoded back.
// When names repeat, the rightmost column's value is kept.
nlohmann::ordered_json table_to_minimal_json(const Table& table);

// Inverse of table_to_json. Shape errors throw std::runtime_error.
Table table_from_json(const nlohmann::ordered_json& doc);

std::string latin1_to_utf8(std::string_view bytes);

// Each code point keeps its low 8 bits, matching the single-byte text encoding.
std::string utf8_to_latin1(std::string_view utf8);

}  // namespace dntkit::dnt
