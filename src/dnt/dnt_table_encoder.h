/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "dnt/dnt_byte_writer.h"
#include "dnt/dnt_table.h"

#include <cstdint>
#include <vector>

namespace dntkit::dnt {

/**
 * Serializes a table. The id column at header index 0 is not written to the
 * column list, raw tags are written as stored, and the output always ends with
 * 05 'THEND'. The table is validated first, so a ContractViolation leaves the
 * writer untouched.
 */
void encode_table(const Table& table, ByteWriter& out);
std::vector<std::uint8_t> encode_table(const Table& table);

}  // namespace dntkit::dnt
