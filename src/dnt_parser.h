/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "dnt/dnt_table.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace dntkit::dnt {

struct ParserDecodeOptions {
    bool validate_sentinel = false;
    bool minimal_json = false;
    bool debug = false;
};

struct DecodeResult {
    Table table;
    nlohmann::ordered_json json = nlohmann::ordered_json::object();
};

struct ParserEncodeOptions {
    bool debug = false;
};

struct EncodeResult {
    std::vector<std::uint8_t> dnt_bytes;
};

class DntParser {
   public:
    static DecodeResult
    DecodeDntFile(const std::filesystem::path& path, const ParserDecodeOptions& opt = {});
    static DecodeResult DecodeDntBytes(
        std::span<const std::uint8_t> bytes,
        const ParserDecodeOptions& opt = {},
        std::string_view label = {}
    );

    static EncodeResult EncodeTable(
        const Table& table,
        const ParserEncodeOptions& opt = {},
        std::string_view label = {}
    );
    static EncodeResult EncodeJsonToDnt(
        const nlohmann::ordered_json& doc,
        const ParserEncodeOptions& opt = {},
        std::string_view label = {}
    );

    static void WriteDntFile(
        const std::filesystem::path& path,
        const Table& table,
        const ParserEncodeOptions& opt = {}
    );
};

}  // namespace dntkit::dnt
