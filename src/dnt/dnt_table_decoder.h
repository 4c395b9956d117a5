/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "dnt/dnt_byte_reader.h"
#include "dnt/dnt_table.h"

#include <cstdint>
#include <span>

namespace dntkit::dnt {

inline constexpr std::size_t kReservedPrefixSize = 4;
inline constexpr std::string_view kSentinel = "THEND";

struct DecodeOptions {
    // Require the 05 'THEND' tail after the last row.
    bool validate_sentinel = false;
};

Table decode_table(ByteReader& reader, DecodeOptions options = {});
Table decode_table(std::span<const std::uint8_t> bytes, DecodeOptions options = {});

}  // namespace dntkit::dnt
