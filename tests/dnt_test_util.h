/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "dnt/dnt_table.h"

#include <cstdint>
#include <initializer_list>
#include <limits>
#include <string>
#include <vector>

namespace dntkit::dnt::test {

inline std::vector<std::uint8_t> bytes_of(std::initializer_list<int> values) {
    std::vector<std::uint8_t> out;
    out.reserve(values.size());
    for (const int v : values) {
        out.push_back(static_cast<std::uint8_t>(v));
    }
    return out;
}

// id, name (Text, 1), level (Int32, 2), rate (Float32, 4), score (Float32, 5)
inline Table make_sample_table() {
    Table table = make_empty_table();
    table.head.push_back(make_column("name", kTagText));
    table.head.push_back(make_column("level", kTagInt32Alt));
    table.head.push_back(make_column("rate", kTagFloat32Alt));
    table.head.push_back(make_column("score", kTagFloat32));

    table.body.push_back(Row{{std::int32_t{1}, std::string("Alice"), std::int32_t{10}, 0.5f, 99.0f}});
    table.body.push_back(Row{{std::int32_t{2}, std::string(""), std::int32_t{-3}, -1.25f, -0.0f}});
    table.body.push_back(Row{
        {std::numeric_limits<std::int32_t>::max(), std::string("Caf\xE9"),
         std::numeric_limits<std::int32_t>::min(), std::numeric_limits<float>::quiet_NaN(),
         std::numeric_limits<float>::infinity()}
    });
    return table;
}

}  // namespace dntkit::dnt::test
