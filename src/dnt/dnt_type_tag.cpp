/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "dnt/dnt_type_tag.h"
#include "dnt/dnt_error.h"

#include <array>
#include <utility>

namespace dntkit::dnt {

static const std::array<std::pair<std::string_view, ValueType>, 3> kValueTypeNames = {{
    {"Text", ValueType::Text},
    {"Int32", ValueType::Int32},
    {"Float32", ValueType::Float32},
}};

std::optional<ValueType> try_resolve_type_tag(std::uint8_t tag) {
    switch (tag) {
        case kTagText:
            return ValueType::Text;
        case kTagInt32Alt:
        case kTagInt32:
            return ValueType::Int32;
        case kTagFloat32Alt:
        case kTagFloat32:
            return ValueType::Float32;
        default:
            return std::nullopt;
    }
}

ValueType resolve_type_tag(std::uint8_t tag) {
    const auto type = try_resolve_type_tag(tag);
    if (!type.has_value()) {
        throw UnknownTypeTagError(tag);
    }
    return *type;
}

std::uint8_t default_type_tag(ValueType type) {
    switch (type) {
        case ValueType::Text:
            return kTagText;
        case ValueType::Int32:
            return kTagInt32;
        case ValueType::Float32:
            return kTagFloat32;
    }
    throw std::invalid_argument("Invalid value type");
}

std::string_view value_type_name(ValueType type) {
    for (const auto& [name, v] : kValueTypeNames) {
        if (v == type) {
            return name;
        }
    }
    return "Unknown";
}

std::optional<ValueType> parse_value_type_name(std::string_view name) {
    for (const auto& [k, v] : kValueTypeNames) {
        if (k == name) {
            return v;
        }
    }
    return std::nullopt;
}

}  // namespace dntkit::dnt
