/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "dnt/dnt_error.h"

#include <bit>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>
#include <utility>
#include <vector>

namespace dntkit::dnt {
class ByteWriter {
   public:
    explicit ByteWriter(std::size_t initial_bytes = 256) { buf_.reserve(initial_bytes); }

    std::size_t byte_length() const { return buf_.size(); }

    void write_u8(std::uint8_t v) { buf_.push_back(v); }

    void write_u16_le(std::uint16_t v) {
        buf_.push_back(static_cast<std::uint8_t>(v & 0xFFu));
        buf_.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
    }

    void write_u32_le(std::uint32_t v) {
        buf_.push_back(static_cast<std::uint8_t>(v & 0xFFu));
        buf_.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
        buf_.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFFu));
        buf_.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFFu));
    }

    void write_i32_le(std::int32_t v) { write_u32_le(static_cast<std::uint32_t>(v)); }

    void write_f32_le(float v) { write_u32_le(std::bit_cast<std::uint32_t>(v)); }

    // Each char is written as one byte, no length prefix.
    void write_chars(std::string_view s) {
        for (const char ch : s) {
            buf_.push_back(static_cast<std::uint8_t>(ch));
        }
    }

    void write_string(std::string_view s) {
        if (s.size() > std::numeric_limits<std::uint16_t>::max()) {
            throw ContractViolation(
                "String of " + std::to_string(s.size()) + " bytes does not fit a u16 length."
            );
        }
        write_u16_le(static_cast<std::uint16_t>(s.size()));
        write_chars(s);
    }

    const std::vector<std::uint8_t>& bytes() const { return buf_; }
    std::vector<std::uint8_t> take_bytes() { return std::move(buf_); }

   private:
    std::vector<std::uint8_t> buf_;
};
}  // namespace dntkit::dnt
