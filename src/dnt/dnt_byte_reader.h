/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "dnt/dnt_error.h"

#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace dntkit::dnt {
class ByteReader {
   public:
    explicit ByteReader(std::span<const std::uint8_t> data) : _data(data), _pos(0) {}

    std::size_t position() const { return _pos; }
    std::size_t length() const { return _data.size(); }
    std::size_t remaining() const { return _data.size() - _pos; }

    void seek(std::size_t pos) {
        if (pos > _data.size()) {
            throw IoError(
                "Seek to offset " + std::to_string(pos) + " past end of stream ("
                + std::to_string(_data.size()) + " bytes)."
            );
        }
        _pos = pos;
    }

    std::span<const std::uint8_t> read_bytes(std::size_t count) {
        if (count > remaining()) {
            throw IoError(
                "Unexpected EOF at offset " + std::to_string(_pos) + ": wanted "
                + std::to_string(count) + " bytes, " + std::to_string(remaining()) + " left."
            );
        }
        const auto out = _data.subspan(_pos, count);
        _pos += count;
        return out;
    }

    std::uint8_t read_u8() { return read_bytes(1)[0]; }

    std::uint16_t read_u16_le() {
        const auto b = read_bytes(2);
        return static_cast<std::uint16_t>(b[0] | (static_cast<std::uint16_t>(b[1]) << 8));
    }

    std::uint32_t read_u32_le() {
        const auto b = read_bytes(4);
        return static_cast<std::uint32_t>(b[0]) | (static_cast<std::uint32_t>(b[1]) << 8)
               | (static_cast<std::uint32_t>(b[2]) << 16)
               | (static_cast<std::uint32_t>(b[3]) << 24);
    }

    std::int32_t read_i32_le() { return static_cast<std::int32_t>(read_u32_le()); }

    float read_f32_le() { return std::bit_cast<float>(read_u32_le()); }

    // u16 length prefix, then one byte per character.
    std::string read_string() {
        const std::uint16_t len = read_u16_le();
        if (len == 0) {
            return {};
        }
        const auto bytes = read_bytes(len);
        return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }

   private:
    std::span<const std::uint8_t> _data;
    std::size_t _pos;
};
}  // namespace dntkit::dnt
