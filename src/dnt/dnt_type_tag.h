/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace dntkit::dnt {

enum class ValueType : std::uint8_t {
    Text,
    Int32,
    Float32,
};

inline constexpr std::uint8_t kTagText = 1;
inline constexpr std::uint8_t kTagInt32Alt = 2;
inline constexpr std::uint8_t kTagInt32 = 3;
inline constexpr std::uint8_t kTagFloat32Alt = 4;
inline constexpr std::uint8_t kTagFloat32 = 5;

/**
 * Maps a raw wire tag to its semantic type.
 * 1 is Text, 2 and 3 are Int32, 4 and 5 are Float32. Anything else throws
 * UnknownTypeTagError.
 */
ValueType resolve_type_tag(std::uint8_t tag);
std::optional<ValueType> try_resolve_type_tag(std::uint8_t tag);

// Tag written for a column that only names its semantic type.
std::uint8_t default_type_tag(ValueType type);

std::string_view value_type_name(ValueType type);
std::optional<ValueType> parse_value_type_name(std::string_view name);

}  // namespace dntkit::dnt
